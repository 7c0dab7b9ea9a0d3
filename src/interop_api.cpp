#include <interop_api.h>
#include <converters/converter_registry.hpp>
#include <converters/plugin_loader.hpp>
#include <core/errors.hpp>
#include <pipeline/conversion_pipeline.hpp>
#include <transforms/transform_registry.hpp>
#include <utils/strings.hpp>
#include <stdexcept>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>

using namespace Polydoc;

// Thread-local error storage
thread_local std::string g_last_error;

const char* polydoc_get_last_error() {
    return g_last_error.c_str();
}

const char* polydoc_get_version() {
    return "0.1.0";
}

static void set_error(const std::exception& e) {
    g_last_error = e.what();
}

#define INTEROP_TRY_CATCH(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::exception& e) { \
        set_error(e); \
        return false; \
    }

#define INTEROP_TRY_CATCH_PTR(...) \
    try { \
        __VA_ARGS__ \
    } catch (const std::exception& e) { \
        set_error(e); \
        return nullptr; \
    }

static char* strdup_safe(const std::string& str) {
    char* out = static_cast<char*>(std::malloc(str.size() + 1));
    if (!out) throw std::bad_alloc();
    std::memcpy(out, str.data(), str.size());
    out[str.size()] = '\0';
    return out;
}

static void copy_fixed(char* dst, size_t cap, const std::string& src) {
    size_t n = std::min(cap - 1, src.size());
    std::memcpy(dst, src.data(), n);
    dst[n] = '\0';
}

static void require_arg(const void* p, const char* name) {
    if (!p) throw ValidationError(std::string("Argument '") + name + "' must not be null", name);
}

void polydoc_free_string(char* str) {
    std::free(str);
}

// =============================================================================
//  Transform lists
// =============================================================================

static std::vector<TransformRequest> parse_transform_list(const char* text) {
    std::vector<TransformRequest> requests;
    if (!text) return requests;

    std::string spec = trim(text);
    if (spec.empty()) return requests;

    if (spec.front() != '[') {
        for (const auto& name : split(spec, ',')) {
            std::string n = trim(name);
            if (!n.empty()) requests.push_back(TransformRequest::named(n));
        }
        return requests;
    }

    json items;
    try {
        items = json::parse(spec);
    } catch (const json::parse_error& e) {
        throw ValidationError(std::string("Invalid transform list: ") + e.what());
    }

    auto& registry = TransformRegistry::global();
    for (const auto& item : items) {
        if (item.is_string()) {
            requests.push_back(TransformRequest::named(item.get<std::string>()));
            continue;
        }
        if (!item.is_object() || !item.contains("name") || !item["name"].is_string())
            throw ValidationError("Transform list entries must be names or objects with a \"name\"");

        std::string name = item["name"].get<std::string>();
        auto meta = registry.get_metadata(name);

        std::map<std::string, ParamValue> params;
        if (item.contains("params")) {
            const auto& given = item["params"];
            if (!given.is_object())
                throw ValidationError("\"params\" of transform '" + name + "' must be an object", name);
            for (const auto& [key, value] : given.items()) {
                auto spec_it = meta->parameters.find(key);
                if (spec_it == meta->parameters.end())
                    throw ValidationError("Unknown parameter '" + key + "' for transform '" + name + "'", key);
                params[key] = param_value_from_json(value, spec_it->second.type);
            }
        }
        requests.push_back(TransformRequest::named(name, std::move(params)));
    }
    return requests;
}

// =============================================================================
//  Detection
// =============================================================================

bool polydoc_detect_format_file(const char* path, char** out_format) {
    INTEROP_TRY_CATCH({
        require_arg(path, "path");
        require_arg(out_format, "out_format");
        auto input = InputSource::from_path(path);
        *out_format = strdup_safe(ConverterRegistry::global().detect_format(input));
        return true;
    })
}

bool polydoc_detect_format_buffer(const char* data, size_t len, const char* filename_hint, char** out_format) {
    INTEROP_TRY_CATCH({
        require_arg(data, "data");
        require_arg(out_format, "out_format");
        std::optional<std::string> hint;
        if (filename_hint) hint = filename_hint;
        auto input = InputSource::from_bytes(std::string(data, len), hint);
        *out_format = strdup_safe(ConverterRegistry::global().detect_format(input));
        return true;
    })
}

// =============================================================================
//  Conversion
// =============================================================================

static ConversionRequest make_request(const char* source_format, const char* target_format,
                                      const char* transforms) {
    require_arg(target_format, "target_format");
    ConversionRequest request;
    if (source_format && *source_format) request.source_format = source_format;
    request.target_format = target_format;
    request.transforms = parse_transform_list(transforms);
    return request;
}

bool polydoc_convert_file(const char* input_path, const char* output_path,
                          const char* source_format, const char* target_format,
                          const char* transforms, HConversionReport* out_report) {
    INTEROP_TRY_CATCH({
        require_arg(input_path, "input_path");
        require_arg(output_path, "output_path");
        ConversionRequest request = make_request(source_format, target_format, transforms);

        ConversionPipeline pipeline;
        auto input = InputSource::from_path(input_path);
        auto output = OutputTarget::to_path(output_path);
        ConversionReport report = pipeline.convert(input, output, request);

        if (out_report) {
            copy_fixed(out_report->source_format, sizeof(out_report->source_format), report.source_format);
            copy_fixed(out_report->target_format, sizeof(out_report->target_format), report.target_format);
            out_report->transforms_applied = report.applied_transforms.size();
            out_report->total_ms = report.timings.total_ms;
        }
        return true;
    })
}

bool polydoc_convert_buffer(const char* data, size_t len, const char* filename_hint,
                            const char* source_format, const char* target_format,
                            const char* transforms, char** out_text, size_t* out_len) {
    INTEROP_TRY_CATCH({
        require_arg(data, "data");
        require_arg(out_text, "out_text");
        ConversionRequest request = make_request(source_format, target_format, transforms);

        std::optional<std::string> hint;
        if (filename_hint) hint = filename_hint;
        auto input = InputSource::from_bytes(std::string(data, len), hint);

        ConversionPipeline pipeline;
        std::string text = pipeline.convert_to_string(input, request);
        *out_text = strdup_safe(text);
        if (out_len) *out_len = text.size();
        return true;
    })
}

// =============================================================================
//  Registries
// =============================================================================

char* polydoc_list_formats() {
    INTEROP_TRY_CATCH_PTR({
        auto& registry = ConverterRegistry::global();
        json formats = json::array();
        for (const auto& name : registry.list_formats()) {
            auto meta = registry.get_format_info(name);
            if (!meta) continue;
            formats.push_back(json{
                {"name", meta->format_name},
                {"description", meta->description},
                {"extensions", meta->extensions},
                {"mime_types", meta->mime_types},
                {"priority", meta->priority},
                {"can_parse", meta->has_parser()},
                {"can_render", meta->has_renderer()},
            });
        }
        return strdup_safe(formats.dump());
    })
}

char* polydoc_list_transforms() {
    INTEROP_TRY_CATCH_PTR({
        auto& registry = TransformRegistry::global();
        json transforms = json::array();
        for (const auto& name : registry.list_transforms()) {
            auto meta = registry.get_metadata(name);
            json params = json::object();
            for (const auto& [key, spec] : meta->parameters) {
                params[key] = json{
                    {"type", std::string(param_type_name(spec.type))},
                    {"required", spec.required},
                    {"help", spec.help},
                };
                if (spec.default_value) params[key]["default"] = param_value_to_string(*spec.default_value);
            }
            transforms.push_back(json{
                {"name", meta->name},
                {"description", meta->description},
                {"priority", meta->priority},
                {"dependencies", meta->dependencies},
                {"tags", meta->tags},
                {"parameters", params},
            });
        }
        return strdup_safe(transforms.dump());
    })
}

bool polydoc_load_plugins(const char* paths, size_t* out_loaded, size_t* out_failed) {
    INTEROP_TRY_CATCH({
        static PluginLoader loader(PluginContext{ConverterRegistry::global(), TransformRegistry::global(),
                                                 FeatureRegistry::global()});

        std::vector<std::string> search;
        if (paths) {
            for (const auto& p : split(paths, ':'))
                if (!p.empty()) search.push_back(p);
        } else {
            search = ConverterRegistry::global().config().plugin_paths;
        }

        DiscoveryReport report = loader.discover(search);
        if (out_loaded) *out_loaded = report.loaded.size();
        if (out_failed) *out_failed = report.failures.size();
        return true;
    })
}
