/**
 * @file test_end_to_end_pipeline.cpp
 * @brief File-to-file conversions through the global registries:
 * plain text -> AST JSON (with transforms) -> plain text.
 */

#include <gtest/gtest.h>
#include <pipeline/conversion_pipeline.hpp>
#include <ast/serialization.hpp>
#include <core/errors.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

using namespace Polydoc;

static std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = ::testing::TempDir();
        source_ = dir_ + "polydoc_e2e_source.txt";
        ast_ = dir_ + "polydoc_e2e_tree.ast";
        result_ = dir_ + "polydoc_e2e_result.txt";

        std::ofstream(source_) << "CONFIDENTIAL\n\n"
                                  "Quarterly numbers are up.\n"
                                  "See the appendix.\n\n"
                                  "Page 1 of 1\n\n"
                                  "Thanks to the team.\n";
    }

    void TearDown() override {
        for (const auto& p : {source_, ast_, result_}) std::remove(p.c_str());
    }

    std::string dir_, source_, ast_, result_;
};

TEST_F(EndToEndTest, TextToAstAndBack) {
    ConversionPipeline pipeline;

    // Stage 1: text -> AST with cleanup and analysis.
    {
        auto in = InputSource::from_path(source_);
        auto out = OutputTarget::to_path(ast_);
        ConversionRequest request;
        request.target_format = "ast";
        request.transforms = {TransformRequest::named("remove-boilerplate"),
                              TransformRequest::named("calculate-word-count")};

        ConversionReport report = pipeline.convert(in, out, request);
        EXPECT_EQ(report.source_format, "plaintext");
        EXPECT_EQ(report.detected_by, "extension");
        EXPECT_EQ(report.applied_transforms,
                  (std::vector<std::string>{"remove-boilerplate", "calculate-word-count"}));
    }

    Document tree = parse_ast_json(read_file(ast_));
    ASSERT_EQ(tree.children.size(), 2u);
    EXPECT_EQ(tree.metadata.at("word_count").get<int>(), 11);
    EXPECT_NO_THROW(validate_document(tree));

    // Stage 2: AST -> text, with the source detected from content alone.
    {
        std::ifstream stream(ast_, std::ios::binary);
        auto in = InputSource::from_stream(stream);
        auto out = OutputTarget::to_path(result_);
        ConversionRequest request;
        request.target_format = "plaintext";
        request.transforms = {TransformRequest::named("text-replacer",
                                                      {{"find", std::string("team")},
                                                       {"replace", std::string("whole team")}})};

        ConversionReport report = pipeline.convert(in, out, request);
        EXPECT_EQ(report.source_format, "ast");
        EXPECT_EQ(report.detected_by, "content");
    }

    EXPECT_EQ(read_file(result_),
              "Quarterly numbers are up.\nSee the appendix.\n\nThanks to the whole team.\n");
}

TEST_F(EndToEndTest, ExplicitSourceFormatOverridesExtension) {
    ConversionPipeline pipeline;
    auto in = InputSource::from_path(source_);

    ConversionRequest request;
    request.source_format = "ast";
    request.target_format = "plaintext";
    EXPECT_THROW(pipeline.convert_to_string(in, request), ParsingError);
}

TEST_F(EndToEndTest, HeadingsGetTableOfContents) {
    Document doc;
    doc.children = {make_heading(1, {Text{"Intro"}}), Paragraph{{Text{"Hello."}}},
                    make_heading(2, {Text{"Setup"}}), Paragraph{{Text{"Install it."}}}};
    std::ofstream(ast_) << to_json_string(doc);

    ConversionPipeline pipeline;
    auto in = InputSource::from_path(ast_);
    ConversionRequest request;
    request.target_format = "plaintext";
    request.transforms = {TransformRequest::named("generate-toc")};

    ConversionReport report;
    std::string text = pipeline.convert_to_string(in, request, &report);
    EXPECT_EQ(report.applied_transforms, (std::vector<std::string>{"add-heading-ids", "generate-toc"}));
    EXPECT_EQ(text, "Table of Contents\n\n- Intro\n  - Setup\n\nIntro\n\nHello.\n\nSetup\n\nInstall it.\n");
}
