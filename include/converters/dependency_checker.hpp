#pragma once

/**
 * @file dependency_checker.hpp
 * @brief Availability and version checks for converter dependencies.
 *
 * Optional capabilities (codec libraries, plugin-provided backends) declare
 * themselves in a FeatureRegistry with their version. A converter's
 * DependencySpec triples are checked against it before its parser or
 * renderer is constructed.
 */

#include <converters/converter_metadata.hpp>
#include <export.hpp>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace Polydoc {

class POLYDOC_API Version {
public:
    /// Dotted numeric release ("1.24.0"); a trailing non-numeric suffix is ignored.
    static std::optional<Version> parse(std::string_view text);

    int compare(const Version& other) const;
    const std::vector<int>& parts() const { return parts_; }
    std::string str() const;

private:
    std::vector<int> parts_;
};

/**
 * @brief Comma separated clauses using >=, <=, >, <, ==, != and ~=.
 * An empty specifier accepts any version.
 */
class POLYDOC_API VersionSpecifier {
public:
    /// @throws ConfigurationError on a malformed clause.
    static VersionSpecifier parse(std::string_view text);

    bool contains(const Version& v) const;
    bool empty() const { return clauses_.empty(); }

private:
    struct Clause {
        std::string op;
        Version version;
    };
    std::vector<Clause> clauses_;
};

class POLYDOC_API FeatureRegistry {
public:
    /// Process-wide instance; pre-populated with the libraries linked into the core.
    static FeatureRegistry& global();

    void declare(std::string name, std::string version = {});
    bool remove(const std::string& name);

    bool has(const std::string& name) const;
    /// Empty string when declared without a version; nullopt when absent.
    std::optional<std::string> version_of(const std::string& name) const;
    std::vector<std::string> list() const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, std::string> features_;
};

struct DependencyReport {
    std::vector<std::string> missing;      // install names
    std::vector<std::string> mismatched;   // "name>=x (found y)"
    std::vector<std::string> requirements; // "name>=x" for everything unmet

    bool ok() const { return missing.empty() && mismatched.empty(); }
};

/**
 * @brief Resolves each spec by probe name, then install name, then the
 * install name with '-' replaced by '_'.
 * @throws ConfigurationError if a version constraint is malformed.
 */
POLYDOC_API DependencyReport check_dependencies(const std::vector<DependencySpec>& specs,
                                                const FeatureRegistry& features);

/// @throws DependencyError carrying the unmet list and a remediation hint.
POLYDOC_API void require_dependencies(const ConverterMetadata& meta,
                                      const std::vector<DependencySpec>& specs,
                                      const FeatureRegistry& features);

} // namespace Polydoc
