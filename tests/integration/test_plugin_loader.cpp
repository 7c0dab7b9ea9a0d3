/**
 * @file test_plugin_loader.cpp
 * @brief Integration tests for static and shared-library plugin discovery.
 */

#include <gtest/gtest.h>
#include <converters/plugin_loader.hpp>
#include <converters/builtin_converters.hpp>
#include <transforms/builtin_transforms.hpp>
#include <pipeline/conversion_pipeline.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

using namespace Polydoc;

namespace {

class ShoutRenderer : public Renderer {
public:
    void render(const Document& doc, OutputTarget& out) override {
        std::string text = extract_document_text(doc, "\n");
        for (auto& c : text) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        out.write(text + "!\n");
    }
};

void register_shout(PluginContext& ctx) {
    ConverterMetadata meta;
    meta.format_name = "shout";
    meta.extensions = {".shout"};
    meta.renderer = RendererFactory([](const json&) -> RendererPtr { return std::make_unique<ShoutRenderer>(); });
    meta.description = "Upper-case text";
    ctx.converters.register_converter(meta);
    ctx.features.declare("shout-engine", "2.0.1");

    TransformMetadata strip;
    strip.name = "strip-code";
    strip.factory = [](const TransformParams&) -> TransformPtr {
        return std::make_unique<RemoveNodesTransform>(std::vector<std::string>{"code", "code_block"});
    };
    ctx.transforms.register_transform(strip);
}

} // namespace

POLYDOC_REGISTER_PLUGIN(shout, register_shout)

class PluginLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        register_builtin_converters(converters);
        transforms.initialize();
    }

    PluginLoader make_loader() { return PluginLoader(PluginContext{converters, transforms, features}); }

    ConverterRegistry converters;
    TransformRegistry transforms;
    FeatureRegistry features;
};

TEST_F(PluginLoaderTest, StaticPluginRegistersConvertersAndTransforms) {
    auto names = PluginLoader::static_plugins();
    ASSERT_NE(std::find(names.begin(), names.end(), "shout"), names.end());

    auto loader = make_loader();
    DiscoveryReport report = loader.load_static();
    EXPECT_NE(std::find(report.loaded.begin(), report.loaded.end(), "shout"), report.loaded.end());

    EXPECT_TRUE(converters.can_render("shout"));
    EXPECT_TRUE(transforms.has_transform("strip-code"));
    EXPECT_EQ(features.version_of("shout-engine"), std::optional<std::string>("2.0.1"));

    ConversionPipeline pipeline(converters, transforms);
    auto in = InputSource::from_bytes("quiet words", std::string("in.txt"));
    ConversionRequest request;
    request.target_format = "shout";
    request.transforms = {TransformRequest::named("strip-code")};
    EXPECT_EQ(pipeline.convert_to_string(in, request), "QUIET WORDS!\n");
}

TEST_F(PluginLoaderTest, StaticPluginsRunOncePerLoader) {
    auto loader = make_loader();
    loader.load_static();
    DiscoveryReport second = loader.load_static();
    EXPECT_TRUE(second.loaded.empty());
    EXPECT_TRUE(second.ok());

    auto loaded = loader.loaded();
    EXPECT_NE(std::find(loaded.begin(), loaded.end(), "shout"), loaded.end());
}

TEST_F(PluginLoaderTest, FailingPluginIsIsolated) {
    PluginLoader::register_static({"broken-for-test", [](PluginContext&) {
        throw ConfigurationError("backend library not found", "broken-for-test");
    }});

    auto loader = make_loader();
    DiscoveryReport report = loader.load_static();

    ASSERT_FALSE(report.ok());
    auto failure = std::find_if(report.failures.begin(), report.failures.end(),
                                [](const PluginFailure& f) { return f.plugin == "broken-for-test"; });
    ASSERT_NE(failure, report.failures.end());
    EXPECT_NE(failure->message.find("backend library not found"), std::string::npos);

    // The healthy plugin still loaded.
    EXPECT_TRUE(converters.has_format("shout"));

    PluginLoader::register_static({"broken-for-test", [](PluginContext&) {}});
}

TEST_F(PluginLoaderTest, NonStandardExceptionIsIsolated) {
    PluginLoader::register_static({"throws-int-for-test", [](PluginContext&) { throw 42; }});
    PluginLoader::register_static({"after-thrower-for-test", [](PluginContext& ctx) {
        ctx.features.declare("after-thrower", "1.0");
    }});

    auto loader = make_loader();
    DiscoveryReport report = loader.load_static();

    auto failure = std::find_if(report.failures.begin(), report.failures.end(),
                                [](const PluginFailure& f) { return f.plugin == "throws-int-for-test"; });
    ASSERT_NE(failure, report.failures.end());
    EXPECT_EQ(failure->message, "unknown exception");
    EXPECT_NE(std::find(report.loaded.begin(), report.loaded.end(), "after-thrower-for-test"), report.loaded.end());
    EXPECT_TRUE(features.version_of("after-thrower").has_value());

    PluginLoader::register_static({"throws-int-for-test", [](PluginContext&) {}});
}

TEST_F(PluginLoaderTest, MissingPathsAndBadLibrariesAreRecorded) {
    std::string bogus = ::testing::TempDir() + "polydoc_not_a_plugin.so";
    std::ofstream(bogus) << "definitely not ELF";

    auto loader = make_loader();
    DiscoveryReport report = loader.discover({"/nonexistent/polydoc/plugins", bogus});

    EXPECT_TRUE(converters.has_format("shout"));
    ASSERT_GE(report.failures.size(), 2u);

    auto has_failure = [&report](const std::string& plugin) {
        return std::any_of(report.failures.begin(), report.failures.end(),
                           [&plugin](const PluginFailure& f) { return f.plugin == plugin; });
    };
    EXPECT_TRUE(has_failure("/nonexistent/polydoc/plugins"));
    EXPECT_TRUE(has_failure("polydoc_not_a_plugin"));
    std::remove(bogus.c_str());
}

TEST_F(PluginLoaderTest, DirectoryScanIgnoresOtherFiles) {
    std::string dir = ::testing::TempDir() + "polydoc_plugin_dir";
    std::filesystem::create_directories(dir);
    std::ofstream(dir + "/README.txt") << "no plugins here";

    auto loader = make_loader();
    DiscoveryReport report = loader.discover({dir});
    auto from_dir = std::count_if(report.failures.begin(), report.failures.end(),
                                  [](const PluginFailure& f) { return f.plugin == "README"; });
    EXPECT_EQ(from_dir, 0);
    std::filesystem::remove_all(dir);
}
