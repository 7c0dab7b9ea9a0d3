#include <pipeline/conversion_pipeline.hpp>
#include <core/errors.hpp>
#include <utils/logger.hpp>
#include <utils/strings.hpp>
#include <chrono>

namespace Polydoc {

namespace {

using Clock = std::chrono::steady_clock;

double elapsed_ms(Clock::time_point since) {
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

} // namespace

json ConversionReport::to_json() const {
    return json{
        {"source_format", source_format},
        {"detected_by", detected_by},
        {"target_format", target_format},
        {"applied_transforms", applied_transforms},
        {"timings_ms", {
            {"detect", timings.detect_ms},
            {"parse", timings.parse_ms},
            {"transform", timings.transform_ms},
            {"render", timings.render_ms},
            {"total", timings.total_ms},
        }},
    };
}

ConversionPipeline::ConversionPipeline(ConverterRegistry& converters, TransformRegistry& transforms)
    : converters_(converters), transforms_(transforms) {}

ConversionPipeline::ConversionPipeline()
    : ConversionPipeline(ConverterRegistry::global(), TransformRegistry::global()) {}

// =============================================================================
//  Parse
// =============================================================================

Document ConversionPipeline::parse_stage(InputSource& input, const ConversionRequest& request, HookContext& ctx,
                                         ConversionReport& report) {
    auto start = Clock::now();
    DetectionResult detection = converters_.detect(input, request.source_format);
    report.timings.detect_ms = elapsed_ms(start);
    report.source_format = detection.format_name;
    report.detected_by = detection.decided_by;
    ctx.source_format = detection.format_name;

    Logger::debug("Parsing " + input.describe() + " as '" + detection.format_name + "' (" +
                  detection.decided_by + ")");

    start = Clock::now();
    ParserPtr parser = converters_.create_parser(detection.format_name, request.parser_options);
    Document doc = parser->parse(input);
    report.timings.parse_ms = elapsed_ms(start);

    hooks_.run(HookPoint::PostParse, doc, ctx);
    return doc;
}

Document ConversionPipeline::parse(InputSource& input, const std::optional<std::string>& format,
                                   const json& options) {
    ConversionRequest request;
    request.source_format = format;
    request.parser_options = options;
    HookContext ctx;
    ConversionReport report;
    return parse_stage(input, request, ctx, report);
}

// =============================================================================
//  Transforms
// =============================================================================

std::vector<ConversionPipeline::Prepared>
ConversionPipeline::prepare(const std::vector<TransformRequest>& requests) const {
    std::vector<std::string> names;
    std::map<std::string, std::map<std::string, ParamValue>> params;
    std::vector<Prepared> direct;

    for (const auto& r : requests) {
        if (r.is_direct()) {
            direct.push_back({r.name.empty() ? "<instance>" : r.name, r.instance});
            continue;
        }
        if (params.count(r.name))
            throw ValidationError("Transform '" + r.name + "' requested more than once", r.name);
        params[r.name] = r.params;
        names.push_back(r.name);
    }

    std::vector<Prepared> prepared;
    if (!names.empty()) {
        for (const auto& name : transforms_.resolve_dependencies(names)) {
            auto it = params.find(name);
            TransformPtr instance = it != params.end() ? transforms_.get_transform(name, it->second)
                                                       : transforms_.get_transform(name);
            prepared.push_back({name, std::shared_ptr<NodeTransformer>(std::move(instance))});
        }
    }
    for (auto& d : direct) prepared.push_back(std::move(d));
    return prepared;
}

Document ConversionPipeline::run_transforms(Document doc, const std::vector<Prepared>& prepared, HookContext& ctx,
                                            std::vector<std::string>* applied) {
    for (const auto& p : prepared) {
        ctx.transform_name = p.name;
        hooks_.run(HookPoint::PreTransform, doc, ctx);

        Logger::debug("Applying transform '" + p.name + "'");
        try {
            doc = p.transform->transform(std::move(doc));
        } catch (const std::exception& e) {
            Logger::error("Transform '" + p.name + "' failed: " + e.what());
            throw;
        }

        try {
            validate_document(doc);
        } catch (const ValidationError& e) {
            throw ValidationError("Transform '" + p.name + "' produced an invalid document: " + e.what(), p.name);
        }

        hooks_.run(HookPoint::PostTransform, doc, ctx);
        if (applied) applied->push_back(p.name);
    }
    ctx.transform_name.clear();
    return doc;
}

Document ConversionPipeline::apply_transforms(Document doc, const std::vector<TransformRequest>& requests,
                                              std::vector<std::string>* applied) {
    std::vector<Prepared> prepared = prepare(requests);
    HookContext ctx;
    return run_transforms(std::move(doc), prepared, ctx, applied);
}

// =============================================================================
//  Render
// =============================================================================

Document ConversionPipeline::pre_render_stage(Document doc, HookContext& ctx) {
    hooks_.run(HookPoint::PreRender, doc, ctx);
    return hooks_.apply_node_hooks(std::move(doc), ctx);
}

void ConversionPipeline::render(const Document& doc, const std::string& format, OutputTarget& out,
                                const json& options) {
    RendererPtr renderer = converters_.create_renderer(format, options);
    renderer->render(doc, out);
    out.flush();
}

std::string ConversionPipeline::render_to_string(const Document& doc, const std::string& format,
                                                 const json& options) {
    RendererPtr renderer = converters_.create_renderer(format, options);
    return renderer->render_to_string(doc);
}

// =============================================================================
//  Full conversion
// =============================================================================

ConversionReport ConversionPipeline::convert(InputSource& input, OutputTarget& out, const ConversionRequest& request) {
    if (request.target_format.empty())
        throw ValidationError("No target format given for " + input.describe());

    auto total = Clock::now();
    ConversionReport report;
    report.target_format = request.target_format;

    // Fail on bad transform parameters before touching the input.
    std::vector<Prepared> prepared = prepare(request.transforms);
    RendererPtr renderer = converters_.create_renderer(request.target_format, request.renderer_options);

    HookContext ctx;
    ctx.target_format = request.target_format;
    Document doc = parse_stage(input, request, ctx, report);

    auto start = Clock::now();
    doc = run_transforms(std::move(doc), prepared, ctx, &report.applied_transforms);
    report.timings.transform_ms = elapsed_ms(start);

    start = Clock::now();
    doc = pre_render_stage(std::move(doc), ctx);
    if (hooks_.has_hooks(HookPoint::PostRender)) {
        std::string output = renderer->render_to_string(doc);
        hooks_.run_output(output, ctx);
        out.write(output);
    } else {
        renderer->render(doc, out);
    }
    out.flush();
    report.timings.render_ms = elapsed_ms(start);
    report.timings.total_ms = elapsed_ms(total);

    Logger::info("Converted " + input.describe() + " from '" + report.source_format + "' to '" +
                 report.target_format + "'" +
                 (report.applied_transforms.empty() ? "" : " via " + join(report.applied_transforms, ", ")));
    return report;
}

std::string ConversionPipeline::convert_to_string(InputSource& input, const ConversionRequest& request,
                                                  ConversionReport* report) {
    if (request.target_format.empty())
        throw ValidationError("No target format given for " + input.describe());

    auto total = Clock::now();
    ConversionReport local;
    local.target_format = request.target_format;

    std::vector<Prepared> prepared = prepare(request.transforms);
    RendererPtr renderer = converters_.create_renderer(request.target_format, request.renderer_options);

    HookContext ctx;
    ctx.target_format = request.target_format;
    Document doc = parse_stage(input, request, ctx, local);

    auto start = Clock::now();
    doc = run_transforms(std::move(doc), prepared, ctx, &local.applied_transforms);
    local.timings.transform_ms = elapsed_ms(start);

    start = Clock::now();
    doc = pre_render_stage(std::move(doc), ctx);
    std::string output = renderer->render_to_string(doc);
    hooks_.run_output(output, ctx);
    local.timings.render_ms = elapsed_ms(start);
    local.timings.total_ms = elapsed_ms(total);

    if (report) *report = std::move(local);
    return output;
}

} // namespace Polydoc
