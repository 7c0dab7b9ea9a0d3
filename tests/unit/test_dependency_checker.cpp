/**
 * @file test_dependency_checker.cpp
 * @brief Unit tests for versions, constraints and feature-based dependency checks.
 */

#include <gtest/gtest.h>
#include <converters/dependency_checker.hpp>
#include <converters/converter_metadata.hpp>
#include <core/errors.hpp>

using namespace Polydoc;

static Version v(const char* text) {
    auto parsed = Version::parse(text);
    EXPECT_TRUE(parsed.has_value()) << text;
    return parsed.value_or(Version{});
}

// ============================================================================
// Versions
// ============================================================================

TEST(VersionTest, ParsesDottedReleases) {
    EXPECT_EQ(v("1.24.0").str(), "1.24.0");
    EXPECT_EQ(v("v2.1").str(), "2.1");
    EXPECT_EQ(v("3.11.3-rc1").str(), "3.11.3");
    EXPECT_FALSE(Version::parse("beta").has_value());
    EXPECT_FALSE(Version::parse("1.99999999999").has_value());
    EXPECT_EQ(v("2147483647").str(), "2147483647");
}

TEST(VersionTest, ComparesWithImplicitZeros) {
    EXPECT_EQ(v("1.2").compare(v("1.2.0")), 0);
    EXPECT_LT(v("1.2").compare(v("1.10")), 0);
    EXPECT_GT(v("2").compare(v("1.99.99")), 0);
}

TEST(VersionSpecifierTest, Operators) {
    auto range = VersionSpecifier::parse(">=1.20, <2.0");
    EXPECT_TRUE(range.contains(v("1.20")));
    EXPECT_TRUE(range.contains(v("1.99")));
    EXPECT_FALSE(range.contains(v("2.0")));
    EXPECT_FALSE(range.contains(v("1.19.9")));

    EXPECT_TRUE(VersionSpecifier::parse("!=1.5").contains(v("1.6")));
    EXPECT_FALSE(VersionSpecifier::parse("==1.5").contains(v("1.6")));
    EXPECT_TRUE(VersionSpecifier::parse("").empty());
}

TEST(VersionSpecifierTest, CompatibleRelease) {
    auto spec = VersionSpecifier::parse("~=1.4.2");
    EXPECT_TRUE(spec.contains(v("1.4.5")));
    EXPECT_FALSE(spec.contains(v("1.5.0")));
    EXPECT_FALSE(spec.contains(v("1.4.1")));
}

TEST(VersionSpecifierTest, RejectsMalformedConstraints) {
    EXPECT_THROW(VersionSpecifier::parse("1.0"), ConfigurationError);
    EXPECT_THROW(VersionSpecifier::parse(">=abc"), ConfigurationError);
    EXPECT_THROW(VersionSpecifier::parse("~=1"), ConfigurationError);
    EXPECT_THROW(VersionSpecifier::parse(">=99999999999"), ConfigurationError);
}

// ============================================================================
// Feature checks
// ============================================================================

TEST(DependencyCheckerTest, GlobalRegistryKnowsJsonLibrary) {
    EXPECT_TRUE(FeatureRegistry::global().has("nlohmann_json"));
}

TEST(DependencyCheckerTest, ReportsMissingAndMismatched) {
    FeatureRegistry features;
    features.declare("libxml2", "2.9.14");
    features.declare("zlib");

    auto report = check_dependencies({{"libxml2", "", ">=2.10"},
                                      {"pdfium", "", ""},
                                      {"zlib", "", ">=1.2"}},
                                     features);

    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.missing, std::vector<std::string>{"pdfium"});
    ASSERT_EQ(report.mismatched.size(), 2u);
    EXPECT_NE(report.mismatched[0].find("found 2.9.14"), std::string::npos);
    EXPECT_NE(report.mismatched[1].find("found unknown"), std::string::npos);
    EXPECT_EQ(report.requirements.size(), 3u);
}

TEST(DependencyCheckerTest, ProbeAndUnderscoredNamesAreTried) {
    FeatureRegistry features;
    features.declare("python_docx", "1.1.0");
    features.declare("xml", "1.0");

    EXPECT_TRUE(check_dependencies({{"python-docx", "", ">=1.0"}}, features).ok());
    EXPECT_TRUE(check_dependencies({{"lxml", "xml", ""}}, features).ok());
}

TEST(DependencyCheckerTest, RequireThrowsWithRemediation) {
    ConverterMetadata meta;
    meta.format_name = "docx";

    FeatureRegistry features;
    try {
        require_dependencies(meta, {{"python-docx", "", ">=1.0"}}, features);
        FAIL() << "expected DependencyError";
    } catch (const DependencyError& e) {
        EXPECT_EQ(e.subject(), "docx");
        EXPECT_EQ(e.missing(), std::vector<std::string>{"python-docx"});
        EXPECT_EQ(e.remediation(), "Install or enable: python-docx>=1.0");
        EXPECT_NE(std::string(e.what()).find("Format 'docx' is unavailable"), std::string::npos);
    }

    features.declare("python-docx", "1.2");
    EXPECT_NO_THROW(require_dependencies(meta, {{"python-docx", "", ">=1.0"}}, features));
}
