/**
 * @file test_conversion_pipeline.cpp
 * @brief Integration tests for ConversionPipeline over real registries.
 */

#include <gtest/gtest.h>
#include <pipeline/conversion_pipeline.hpp>
#include <converters/builtin_converters.hpp>
#include <ast/serialization.hpp>
#include <core/errors.hpp>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

using namespace Polydoc;

namespace {

/// Emits a heading level no renderer could accept.
class BreakHeadingsTransform : public NodeTransformer {
protected:
    std::optional<Node> visit_heading(Heading node) override {
        node.level = 9;
        return Node(std::move(node));
    }
};

class UppercaseTransform : public NodeTransformer {
protected:
    std::optional<Node> visit_text(Text node) override {
        for (auto& c : node.content) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return Node(std::move(node));
    }
};

Document sample_document() {
    Document doc;
    doc.children = {make_heading(1, {Text{"Overview"}}), Paragraph{{Text{"CONFIDENTIAL"}}},
                    Paragraph{{Text{"Body text here."}}}, make_heading(2, {Text{"Details"}})};
    return doc;
}

} // namespace

class ConversionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        register_builtin_converters(converters);
        transforms.initialize();
    }

    ConverterRegistry converters;
    TransformRegistry transforms;
    ConversionPipeline pipeline{converters, transforms};
};

TEST_F(ConversionPipelineTest, ConvertsWithResolvedTransformOrder) {
    auto in = InputSource::from_bytes(to_json_string(sample_document()), std::string("sample.ast"));
    ConversionRequest request;
    request.target_format = "ast";
    request.transforms = {TransformRequest::named("generate-toc", {{"max_level", int64_t{2}}}),
                          TransformRequest::named("remove-boilerplate")};

    ConversionReport report;
    std::string output = pipeline.convert_to_string(in, request, &report);

    EXPECT_EQ(report.source_format, "ast");
    EXPECT_EQ(report.detected_by, "extension");
    EXPECT_EQ(report.applied_transforms,
              (std::vector<std::string>{"add-heading-ids", "remove-boilerplate", "generate-toc"}));
    EXPECT_GE(report.timings.total_ms, 0.0);
    EXPECT_EQ(report.to_json()["applied_transforms"].size(), 3u);

    Document result = parse_ast_json(output);
    ASSERT_EQ(result.children.size(), 5u);
    EXPECT_EQ(extract_text(result.children[0]), "Table of Contents");
    EXPECT_TRUE(result.children[1].is<List>());
    EXPECT_EQ(result.children[2].as<Heading>().metadata.at("id"), "overview");
    EXPECT_EQ(extract_text(result.children[3]), "Body text here.");
}

TEST_F(ConversionPipelineTest, ConvertWritesToTarget) {
    auto in = InputSource::from_bytes("first\n\nsecond\n", std::nullopt, std::string("text/plain"));
    std::ostringstream sink;
    auto out = OutputTarget::to_stream(sink);

    ConversionRequest request;
    request.target_format = "plaintext";
    request.transforms = {TransformRequest::direct("uppercase", std::make_shared<UppercaseTransform>())};

    ConversionReport report = pipeline.convert(in, out, request);
    EXPECT_EQ(sink.str(), "FIRST\n\nSECOND\n");
    EXPECT_EQ(report.detected_by, "mime");
    EXPECT_EQ(report.applied_transforms, std::vector<std::string>{"uppercase"});
}

TEST_F(ConversionPipelineTest, BadParameterLeavesDocumentUntouched) {
    Document doc = sample_document();
    std::vector<std::string> applied;

    EXPECT_THROW(pipeline.apply_transforms(doc,
                                           {TransformRequest::named("add-heading-ids"),
                                            TransformRequest::named("heading-offset",
                                                                    {{"offset", std::string("two")}})},
                                           &applied),
                 ValidationError);
    EXPECT_TRUE(applied.empty());
    EXPECT_FALSE(doc.children[0].as<Heading>().metadata.contains("id"));
}

TEST_F(ConversionPipelineTest, BadParameterFailsBeforeReadingInput) {
    std::istringstream stream("never read");
    auto in = InputSource::from_stream(stream, std::string("x.txt"));
    ConversionRequest request;
    request.target_format = "plaintext";
    request.transforms = {TransformRequest::named("remove-nodes")};

    EXPECT_THROW(pipeline.convert_to_string(in, request), ValidationError);
    EXPECT_EQ(in.bytes_read(), 0u);
}

TEST_F(ConversionPipelineTest, InvalidResultIsRejected) {
    try {
        pipeline.apply_transforms(sample_document(),
                                  {TransformRequest::direct("break-headings",
                                                            std::make_shared<BreakHeadingsTransform>())});
        FAIL() << "expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_EQ(e.subject(), "break-headings");
        EXPECT_NE(std::string(e.what()).find("produced an invalid document"), std::string::npos);
    }
}

TEST_F(ConversionPipelineTest, DuplicateAndUnknownRequests) {
    EXPECT_THROW(pipeline.apply_transforms(Document{}, {TransformRequest::named("remove-images"),
                                                        TransformRequest::named("remove-images")}),
                 ValidationError);
    EXPECT_THROW(pipeline.apply_transforms(Document{}, {TransformRequest::named("no-such-transform")}),
                 DependencyResolutionError);
}

TEST_F(ConversionPipelineTest, NamedTransformsRunBeforeDirectOnes) {
    std::vector<std::string> applied;
    Document out = pipeline.apply_transforms(
        sample_document(),
        {TransformRequest::direct("upper", std::make_shared<UppercaseTransform>()),
         TransformRequest::named("add-heading-ids")},
        &applied);

    EXPECT_EQ(applied, (std::vector<std::string>{"add-heading-ids", "upper"}));
    // Ids were computed from the original casing.
    EXPECT_EQ(out.children[0].as<Heading>().metadata.at("id"), "overview");
    EXPECT_EQ(extract_text(out.children[0]), "OVERVIEW");
}

TEST_F(ConversionPipelineTest, HooksFireInStageOrder) {
    std::vector<std::string> calls;
    auto record = [&calls](const std::string& label) {
        return [&calls, label](Document&, HookContext& ctx) {
            calls.push_back(label + (ctx.transform_name.empty() ? "" : ":" + ctx.transform_name));
        };
    };
    auto& hooks = pipeline.hooks();
    hooks.add_document_hook(HookPoint::PostParse, record("post_parse"));
    hooks.add_document_hook(HookPoint::PreTransform, record("pre"));
    hooks.add_document_hook(HookPoint::PostTransform, record("post"));
    hooks.add_document_hook(HookPoint::PreRender, record("pre_render"));
    hooks.add_node_hook("paragraph", [&calls](Node node, HookContext&) -> std::optional<Node> {
        calls.push_back("node");
        return node;
    });
    hooks.add_output_hook([&calls](std::string& out, HookContext& ctx) {
        calls.push_back("post_render");
        out = "[" + ctx.source_format + "->" + ctx.target_format + "] " + out;
    });

    auto in = InputSource::from_bytes("only paragraph", std::string("a.txt"));
    ConversionRequest request;
    request.target_format = "plaintext";
    request.transforms = {TransformRequest::named("calculate-word-count")};
    std::string output = pipeline.convert_to_string(in, request);

    EXPECT_EQ(calls, (std::vector<std::string>{"post_parse", "pre:calculate-word-count",
                                               "post:calculate-word-count", "pre_render", "node",
                                               "post_render"}));
    EXPECT_EQ(output, "[plaintext->plaintext] only paragraph\n");
}

TEST_F(ConversionPipelineTest, OutputHooksApplyWhenStreaming) {
    pipeline.hooks().add_output_hook([](std::string& out, HookContext&) { out += "EOF\n"; });

    auto in = InputSource::from_bytes("text", std::string("a.txt"));
    std::ostringstream sink;
    auto out = OutputTarget::to_stream(sink);
    ConversionRequest request;
    request.target_format = "plaintext";
    pipeline.convert(in, out, request);
    EXPECT_EQ(sink.str(), "text\nEOF\n");
}

TEST_F(ConversionPipelineTest, MissingTargetAndUnknownFormats) {
    auto in = InputSource::from_bytes("text", std::string("a.txt"));
    ConversionRequest request;
    EXPECT_THROW(pipeline.convert_to_string(in, request), ValidationError);

    request.target_format = "docx";
    EXPECT_THROW(pipeline.convert_to_string(in, request), FormatDetectionError);

    auto unknown = InputSource::from_bytes("\x7f\x45\x4c\x46");
    request.target_format = "plaintext";
    EXPECT_THROW(pipeline.convert_to_string(unknown, request), FormatDetectionError);
}
