#include <converters/converter_registry.hpp>
#include <converters/builtin_converters.hpp>
#include <core/errors.hpp>
#include <io/bounded_reader.hpp>
#include <utils/logger.hpp>
#include <utils/strings.hpp>
#include <algorithm>
#include <mutex>

namespace Polydoc {

namespace {

using EntryList = std::vector<std::shared_ptr<const ConverterMetadata>>;

std::vector<std::string> names_of(const EntryList& list) {
    std::vector<std::string> out;
    out.reserve(list.size());
    for (const auto& m : list) out.push_back(m->format_name);
    return out;
}

EntryList intersect(const EntryList& a, const EntryList& b) {
    EntryList out;
    for (const auto& m : a) {
        if (std::find(b.begin(), b.end(), m) != b.end()) out.push_back(m);
    }
    return out;
}

std::string qualify(const std::string& format_name, const std::string& name) {
    if (name.find("::") != std::string::npos) return name;
    return format_name + "::" + name;
}

} // namespace

ConverterRegistry::ConverterRegistry(RuntimeConfig config)
    : config_(std::move(config)), features_(&FeatureRegistry::global()) {}

ConverterRegistry& ConverterRegistry::global() {
    static ConverterRegistry instance;
    static std::once_flag once;
    std::call_once(once, [] {
        RuntimeConfig config = RuntimeConfig::load_from_env();
        config.apply();
        instance.set_config(std::move(config));
        register_builtin_converters(instance);
    });
    return instance;
}

// =============================================================================
//  Registration
// =============================================================================

void ConverterRegistry::register_converter(ConverterMetadata meta) {
    meta.validate();
    auto shared = std::make_shared<const ConverterMetadata>(std::move(meta));
    const std::string& name = shared->format_name;

    std::unique_lock lock(mutex_);
    if (entries_.count(name))
        Logger::warn("Converter '" + name + "' is already registered; overwriting");
    else
        Logger::debug("Registered converter '" + name + "'");
    entries_[name] = Entry{shared, next_sequence_++};
}

bool ConverterRegistry::unregister(const std::string& format_name) {
    std::unique_lock lock(mutex_);
    bool removed = entries_.erase(format_name) > 0;
    if (removed) Logger::debug("Unregistered converter '" + format_name + "'");
    return removed;
}

void ConverterRegistry::register_parser_factory(const std::string& qualified_name, ParserFactory factory) {
    if (!factory) throw ConfigurationError("Null parser factory for '" + qualified_name + "'", qualified_name);
    std::unique_lock lock(mutex_);
    parser_factories_[qualified_name] = std::move(factory);
}

void ConverterRegistry::register_renderer_factory(const std::string& qualified_name, RendererFactory factory) {
    if (!factory) throw ConfigurationError("Null renderer factory for '" + qualified_name + "'", qualified_name);
    std::unique_lock lock(mutex_);
    renderer_factories_[qualified_name] = std::move(factory);
}

void ConverterRegistry::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    parser_factories_.clear();
    renderer_factories_.clear();
}

// =============================================================================
//  Lookup
// =============================================================================

std::vector<ConverterRegistry::Entry> ConverterRegistry::snapshot() const {
    std::shared_lock lock(mutex_);
    std::vector<Entry> out;
    out.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) out.push_back(entry);
    std::sort(out.begin(), out.end(),
              [](const Entry& a, const Entry& b) { return a.sequence < b.sequence; });
    return out;
}

bool ConverterRegistry::has_format(const std::string& format_name) const {
    std::shared_lock lock(mutex_);
    return entries_.count(format_name) > 0;
}

std::vector<std::string> ConverterRegistry::list_formats() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(entries_.size());
    for (const auto& [name, _] : entries_) names.push_back(name);
    return names;
}

std::shared_ptr<const ConverterMetadata> ConverterRegistry::get_format_info(const std::string& format_name) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(format_name);
    return it == entries_.end() ? nullptr : it->second.meta;
}

std::shared_ptr<const ConverterMetadata> ConverterRegistry::require_format(const std::string& format_name) const {
    auto meta = get_format_info(format_name);
    if (!meta) throw FormatDetectionError("Unknown format '" + format_name + "'", format_name);
    return meta;
}

std::vector<std::string> ConverterRegistry::formats_for_extension(const std::string& filename) const {
    std::vector<std::string> out;
    for (const auto& e : snapshot())
        if (e.meta->matches_extension(filename)) out.push_back(e.meta->format_name);
    return out;
}

bool ConverterRegistry::can_parse(const std::string& format_name) const {
    auto meta = get_format_info(format_name);
    return meta && meta->has_parser();
}

bool ConverterRegistry::can_render(const std::string& format_name) const {
    auto meta = get_format_info(format_name);
    return meta && meta->has_renderer();
}

std::vector<std::string> ConverterRegistry::supported_targets() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> out;
    for (const auto& [name, entry] : entries_)
        if (entry.meta->has_renderer()) out.push_back(name);
    return out;
}

// =============================================================================
//  Detection
// =============================================================================

DetectionResult ConverterRegistry::detect(InputSource& input,
                                          const std::optional<std::string>& explicit_format) const {
    DetectionResult result;

    if (explicit_format) {
        require_format(*explicit_format);
        result.format_name = *explicit_format;
        result.decided_by = "explicit";
        result.candidates = {*explicit_format};
        return result;
    }

    const auto entries = snapshot();
    const RuntimeConfig cfg = config();

    std::map<const ConverterMetadata*, uint64_t> sequence;
    for (const auto& e : entries) sequence[e.meta.get()] = e.sequence;

    // Cheap signals.
    EntryList by_extension, by_mime, by_magic;
    if (const auto& filename = input.filename()) {
        for (const auto& e : entries)
            if (e.meta->matches_extension(*filename)) by_extension.push_back(e.meta);
    }
    if (const auto& mime = input.mime_type()) {
        for (const auto& e : entries)
            if (e.meta->matches_mime(*mime)) by_mime.push_back(e.meta);
    }
    // Widen the prefix so no registered pattern can fall outside it.
    size_t prefix_len = cfg.detection_prefix_bytes;
    for (const auto& e : entries) prefix_len = std::max(prefix_len, e.meta->magic_span());
    const std::string prefix = input.read_prefix(prefix_len);
    for (const auto& e : entries)
        if (e.meta->matches_magic(prefix)) by_magic.push_back(e.meta);

    EntryList candidates;
    std::string decided_by;

    std::vector<std::pair<const EntryList*, const char*>> signals;
    if (!by_magic.empty()) signals.emplace_back(&by_magic, "magic");
    if (!by_mime.empty()) signals.emplace_back(&by_mime, "mime");
    if (!by_extension.empty()) signals.emplace_back(&by_extension, "extension");

    if (!signals.empty()) {
        candidates = *signals.front().first;
        for (size_t i = 1; i < signals.size(); ++i) candidates = intersect(candidates, *signals[i].first);

        if (candidates.empty()) {
            // Conflicting signals: content evidence wins.
            candidates = *signals.front().first;
            decided_by = signals.front().second;
            Logger::debug("Detection signals conflict for " + input.describe() + "; trusting " + decided_by);
        } else {
            decided_by = signals.front().second;
        }

        if (candidates.size() > 1) {
            EntryList affirmative, undetectable;
            for (const auto& meta : candidates) {
                if (!meta->content_detector) {
                    undetectable.push_back(meta);
                    continue;
                }
                BoundedReader reader(input, cfg.detector_budget_bytes);
                if (meta->content_detector->matches(reader)) affirmative.push_back(meta);
            }
            if (!affirmative.empty()) {
                candidates = std::move(affirmative);
                decided_by = "content";
            } else {
                candidates = std::move(undetectable);
            }
        }
    } else {
        // No signal: only formats without magic may claim the input by content.
        auto prefix_source = InputSource::from_bytes(prefix, input.filename());
        for (const auto& e : entries) {
            if (!e.meta->content_detector || !e.meta->magic_bytes.empty()) continue;
            BoundedReader reader(prefix_source, prefix.size());
            if (e.meta->content_detector->matches(reader)) candidates.push_back(e.meta);
        }
        decided_by = "content";
    }

    if (candidates.empty())
        throw FormatDetectionError("Could not detect format of " + input.describe(), input.describe());

    result.candidates = names_of(candidates);
    if (candidates.size() > 1) decided_by = "priority";

    auto best = std::min_element(candidates.begin(), candidates.end(),
        [&sequence](const auto& a, const auto& b) {
            if (a->priority != b->priority) return a->priority > b->priority;
            return sequence[a.get()] < sequence[b.get()];
        });

    result.format_name = (*best)->format_name;
    result.decided_by = decided_by;
    Logger::debug("Detected format '" + result.format_name + "' for " + input.describe() +
                  " (" + decided_by + ")");
    return result;
}

// =============================================================================
//  Parser / renderer construction
// =============================================================================

ParserFactory ConverterRegistry::resolve_parser(const ConverterMetadata& meta) const {
    if (const auto* factory = std::get_if<ParserFactory>(&meta.parser)) {
        if (*factory) return *factory;
    } else if (const auto* name = std::get_if<std::string>(&meta.parser)) {
        std::string qualified = qualify(meta.format_name, *name);
        std::shared_lock lock(mutex_);
        auto it = parser_factories_.find(qualified);
        if (it == parser_factories_.end())
            throw ConfigurationError("Cannot resolve parser '" + qualified + "' for format '" +
                                     meta.format_name + "'", qualified);
        return it->second;
    }
    throw ConfigurationError("Format '" + meta.format_name + "' has no parser", meta.format_name);
}

RendererFactory ConverterRegistry::resolve_renderer(const ConverterMetadata& meta) const {
    if (const auto* factory = std::get_if<RendererFactory>(&meta.renderer)) {
        if (*factory) return *factory;
    } else if (const auto* name = std::get_if<std::string>(&meta.renderer)) {
        std::string qualified = qualify(meta.format_name, *name);
        std::shared_lock lock(mutex_);
        auto it = renderer_factories_.find(qualified);
        if (it == renderer_factories_.end())
            throw ConfigurationError("Cannot resolve renderer '" + qualified + "' for format '" +
                                     meta.format_name + "'", qualified);
        return it->second;
    }
    throw ConfigurationError("Format '" + meta.format_name + "' has no renderer", meta.format_name);
}

ParserPtr ConverterRegistry::create_parser(const std::string& format_name, const json& options) const {
    auto meta = require_format(format_name);
    auto factory = resolve_parser(*meta);
    require_dependencies(*meta, meta->parser_required_packages, features());
    auto parser = factory(options);
    if (!parser) throw ConfigurationError("Parser factory for '" + format_name + "' returned null", format_name);
    return parser;
}

RendererPtr ConverterRegistry::create_renderer(const std::string& format_name, const json& options) const {
    auto meta = require_format(format_name);
    auto factory = resolve_renderer(*meta);
    require_dependencies(*meta, meta->renderer_required_packages, features());
    auto renderer = factory(options);
    if (!renderer) throw ConfigurationError("Renderer factory for '" + format_name + "' returned null", format_name);
    return renderer;
}

std::map<std::string, std::vector<std::string>>
ConverterRegistry::check_dependencies(const std::optional<std::string>& format_name) const {
    std::vector<std::shared_ptr<const ConverterMetadata>> targets;
    if (format_name) {
        targets.push_back(require_format(*format_name));
    } else {
        for (const auto& e : snapshot()) targets.push_back(e.meta);
    }

    std::map<std::string, std::vector<std::string>> missing;
    for (const auto& meta : targets) {
        std::vector<DependencySpec> specs = meta->parser_required_packages;
        specs.insert(specs.end(), meta->renderer_required_packages.begin(),
                     meta->renderer_required_packages.end());

        DependencyReport report = Polydoc::check_dependencies(specs, features());
        if (report.ok()) continue;

        std::vector<std::string> unmet;
        for (const auto& req : report.requirements)
            if (std::find(unmet.begin(), unmet.end(), req) == unmet.end()) unmet.push_back(req);
        missing[meta->format_name] = std::move(unmet);
    }
    return missing;
}

// =============================================================================
//  Configuration
// =============================================================================

void ConverterRegistry::set_config(RuntimeConfig config) {
    std::unique_lock lock(mutex_);
    config_ = std::move(config);
}

RuntimeConfig ConverterRegistry::config() const {
    std::shared_lock lock(mutex_);
    return config_;
}

void ConverterRegistry::set_feature_registry(FeatureRegistry& features) {
    std::unique_lock lock(mutex_);
    features_ = &features;
}

FeatureRegistry& ConverterRegistry::features() const {
    std::shared_lock lock(mutex_);
    return *features_;
}

} // namespace Polydoc
