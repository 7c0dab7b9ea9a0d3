#include <converters/dependency_checker.hpp>
#include <core/errors.hpp>
#include <utils/strings.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <limits>
#include <mutex>

namespace Polydoc {

// =============================================================================
//  Version
// =============================================================================

std::optional<Version> Version::parse(std::string_view text) {
    std::string s = trim(text);
    if (!s.empty() && (s[0] == 'v' || s[0] == 'V')) s.erase(0, 1);

    Version v;
    size_t pos = 0;
    while (pos < s.size()) {
        if (!std::isdigit(static_cast<unsigned char>(s[pos]))) break;
        int part = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            int digit = s[pos] - '0';
            if (part > (std::numeric_limits<int>::max() - digit) / 10) return std::nullopt;
            part = part * 10 + digit;
            ++pos;
        }
        v.parts_.push_back(part);
        if (pos < s.size() && s[pos] == '.') ++pos;
        else break;
    }
    if (v.parts_.empty()) return std::nullopt;
    return v;
}

int Version::compare(const Version& other) const {
    size_t n = std::max(parts_.size(), other.parts_.size());
    for (size_t i = 0; i < n; ++i) {
        int a = i < parts_.size() ? parts_[i] : 0;
        int b = i < other.parts_.size() ? other.parts_[i] : 0;
        if (a != b) return a < b ? -1 : 1;
    }
    return 0;
}

std::string Version::str() const {
    std::string out;
    for (size_t i = 0; i < parts_.size(); ++i) {
        if (i) out += '.';
        out += std::to_string(parts_[i]);
    }
    return out;
}

// =============================================================================
//  VersionSpecifier
// =============================================================================

VersionSpecifier VersionSpecifier::parse(std::string_view text) {
    static const char* kOps[] = {"~=", ">=", "<=", "==", "!=", ">", "<"};

    VersionSpecifier spec;
    for (const auto& raw : split(text, ',')) {
        std::string clause = trim(raw);
        if (clause.empty()) continue;

        std::string op;
        for (const char* candidate : kOps) {
            if (clause.rfind(candidate, 0) == 0) {
                op = candidate;
                break;
            }
        }
        if (op.empty())
            throw ConfigurationError("Invalid version constraint '" + std::string(text) + "'",
                                     std::string(text));

        auto version = Version::parse(std::string_view(clause).substr(op.size()));
        if (!version || (op == "~=" && version->parts().size() < 2))
            throw ConfigurationError("Invalid version constraint '" + std::string(text) + "'",
                                     std::string(text));
        spec.clauses_.push_back({op, *version});
    }
    return spec;
}

bool VersionSpecifier::contains(const Version& v) const {
    for (const auto& c : clauses_) {
        int cmp = v.compare(c.version);
        bool ok = true;
        if (c.op == ">=")      ok = cmp >= 0;
        else if (c.op == "<=") ok = cmp <= 0;
        else if (c.op == ">")  ok = cmp > 0;
        else if (c.op == "<")  ok = cmp < 0;
        else if (c.op == "==") ok = cmp == 0;
        else if (c.op == "!=") ok = cmp != 0;
        else if (c.op == "~=") {
            // Compatible release: >= version and same leading components.
            const auto& want = c.version.parts();
            ok = cmp >= 0;
            for (size_t i = 0; ok && i + 1 < want.size(); ++i) {
                int have = i < v.parts().size() ? v.parts()[i] : 0;
                ok = have == want[i];
            }
        }
        if (!ok) return false;
    }
    return true;
}

// =============================================================================
//  FeatureRegistry
// =============================================================================

FeatureRegistry& FeatureRegistry::global() {
    static FeatureRegistry instance;
    static std::once_flag once;
    std::call_once(once, [] {
        instance.declare("nlohmann_json", std::to_string(NLOHMANN_JSON_VERSION_MAJOR) + "." +
                                          std::to_string(NLOHMANN_JSON_VERSION_MINOR) + "." +
                                          std::to_string(NLOHMANN_JSON_VERSION_PATCH));
    });
    return instance;
}

void FeatureRegistry::declare(std::string name, std::string version) {
    std::unique_lock lock(mutex_);
    features_[std::move(name)] = std::move(version);
}

bool FeatureRegistry::remove(const std::string& name) {
    std::unique_lock lock(mutex_);
    return features_.erase(name) > 0;
}

bool FeatureRegistry::has(const std::string& name) const {
    std::shared_lock lock(mutex_);
    return features_.count(name) > 0;
}

std::optional<std::string> FeatureRegistry::version_of(const std::string& name) const {
    std::shared_lock lock(mutex_);
    auto it = features_.find(name);
    if (it == features_.end()) return std::nullopt;
    return it->second;
}

std::vector<std::string> FeatureRegistry::list() const {
    std::shared_lock lock(mutex_);
    std::vector<std::string> names;
    names.reserve(features_.size());
    for (const auto& [name, _] : features_) names.push_back(name);
    return names;
}

// =============================================================================
//  Checks
// =============================================================================

namespace {

std::optional<std::string> lookup(const DependencySpec& spec, const FeatureRegistry& features) {
    std::string underscored = spec.install_name;
    std::replace(underscored.begin(), underscored.end(), '-', '_');
    const std::string& alt = underscored;
    for (const std::string* name : {&spec.probe_name, &spec.install_name, &alt}) {
        if (name->empty()) continue;
        if (auto v = features.version_of(*name)) return v;
    }
    return std::nullopt;
}

} // namespace

DependencyReport check_dependencies(const std::vector<DependencySpec>& specs,
                                    const FeatureRegistry& features) {
    DependencyReport report;
    for (const auto& spec : specs) {
        std::string requirement = spec.install_name + spec.version_constraint;
        auto found = lookup(spec, features);
        if (!found) {
            report.missing.push_back(spec.install_name);
            report.requirements.push_back(requirement);
            continue;
        }

        auto constraint = VersionSpecifier::parse(spec.version_constraint);
        if (constraint.empty()) continue;

        auto installed = Version::parse(*found);
        if (!installed || !constraint.contains(*installed)) {
            report.mismatched.push_back(requirement + " (found " +
                                        (found->empty() ? std::string("unknown") : *found) + ")");
            report.requirements.push_back(requirement);
        }
    }
    return report;
}

void require_dependencies(const ConverterMetadata& meta,
                          const std::vector<DependencySpec>& specs,
                          const FeatureRegistry& features) {
    DependencyReport report = check_dependencies(specs, features);
    if (report.ok()) return;
    throw DependencyError(meta.format_name, report.missing, report.mismatched,
                          meta.remediation(report.requirements));
}

} // namespace Polydoc
