#pragma once

/**
 * @file conversion_pipeline.hpp
 * @brief parse -> ordered transforms -> render, wired through the registries.
 *
 * Stages and hooks, in order:
 *   detect + parse, PostParse hooks
 *   for each transform: PreTransform hooks, transform, validation, PostTransform hooks
 *   PreRender hooks, node hooks, render, PostRender (output) hooks
 */

#include <ast/nodes.hpp>
#include <converters/converter_registry.hpp>
#include <io/input_source.hpp>
#include <io/output_target.hpp>
#include <pipeline/hooks.hpp>
#include <transforms/transform_registry.hpp>
#include <export.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Polydoc {

/// A registered transform by name, or a caller-built instance.
struct TransformRequest {
    std::string name;
    std::map<std::string, ParamValue> params;
    std::shared_ptr<NodeTransformer> instance;

    static TransformRequest named(std::string name, std::map<std::string, ParamValue> params = {}) {
        return TransformRequest{std::move(name), std::move(params), nullptr};
    }

    /// @p label only identifies the instance in reports and errors.
    static TransformRequest direct(std::string label, std::shared_ptr<NodeTransformer> instance) {
        return TransformRequest{std::move(label), {}, std::move(instance)};
    }

    bool is_direct() const { return instance != nullptr; }
};

struct ConversionRequest {
    std::optional<std::string> source_format;
    std::string target_format;
    json parser_options = json::object();
    json renderer_options = json::object();
    std::vector<TransformRequest> transforms;
};

struct StageTimings {
    double detect_ms = 0;
    double parse_ms = 0;
    double transform_ms = 0;
    double render_ms = 0;
    double total_ms = 0;
};

struct ConversionReport {
    std::string source_format;
    /// Detection signal that chose the source format.
    std::string detected_by;
    std::string target_format;
    std::vector<std::string> applied_transforms;
    StageTimings timings;

    json to_json() const;
};

class POLYDOC_API ConversionPipeline {
public:
    ConversionPipeline(ConverterRegistry& converters, TransformRegistry& transforms);

    /// Pipeline over the global registries.
    ConversionPipeline();

    HookManager& hooks() { return hooks_; }
    const HookManager& hooks() const { return hooks_; }

    /// @throws FormatDetectionError, DependencyError, ConfigurationError, ParsingError.
    Document parse(InputSource& input,
                   const std::optional<std::string>& format = std::nullopt,
                   const json& options = json::object());

    /**
     * @brief Applies @p requests to @p doc.
     *
     * Named requests are resolved together into one dependency order;
     * dependencies pulled in by closure run with default parameters. Direct
     * instances run afterwards in request order. Every transform is built
     * before the first one runs, so a bad parameter leaves @p doc untouched.
     *
     * @param applied Receives the names of the transforms in execution order.
     * @throws DependencyResolutionError, ValidationError.
     */
    Document apply_transforms(Document doc, const std::vector<TransformRequest>& requests,
                              std::vector<std::string>* applied = nullptr);

    void render(const Document& doc, const std::string& format, OutputTarget& out,
                const json& options = json::object());
    std::string render_to_string(const Document& doc, const std::string& format,
                                 const json& options = json::object());

    /// Full conversion into @p out. Transforms and the renderer are built before
    /// the input is read.
    ConversionReport convert(InputSource& input, OutputTarget& out, const ConversionRequest& request);

    /// Full conversion returning the rendered output; PostRender hooks apply.
    std::string convert_to_string(InputSource& input, const ConversionRequest& request,
                                  ConversionReport* report = nullptr);

private:
    struct Prepared {
        std::string name;
        std::shared_ptr<NodeTransformer> transform;
    };

    std::vector<Prepared> prepare(const std::vector<TransformRequest>& requests) const;
    Document run_transforms(Document doc, const std::vector<Prepared>& prepared, HookContext& ctx,
                            std::vector<std::string>* applied);
    Document parse_stage(InputSource& input, const ConversionRequest& request, HookContext& ctx,
                         ConversionReport& report);
    Document pre_render_stage(Document doc, HookContext& ctx);

    ConverterRegistry& converters_;
    TransformRegistry& transforms_;
    HookManager hooks_;
};

} // namespace Polydoc
