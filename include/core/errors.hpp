#pragma once

/**
 * @file errors.hpp
 * @brief Exception hierarchy raised by the Polydoc core.
 *
 * Every error carries the identifier it concerns (a format name, transform
 * name, parameter or field) so callers can report it without parsing what().
 */

#include <export.hpp>
#include <stdexcept>
#include <string>
#include <vector>

namespace Polydoc {

class POLYDOC_API Error : public std::runtime_error {
public:
    Error(const std::string& message, std::string subject = {})
        : std::runtime_error(message), subject_(std::move(subject)) {}

    const std::string& subject() const noexcept { return subject_; }

private:
    std::string subject_;
};

/// No registered converter (or more than one, unresolvably) fits the input.
class POLYDOC_API FormatDetectionError : public Error {
public:
    using Error::Error;
};

/// A converter's required feature is missing or has the wrong version.
class POLYDOC_API DependencyError : public Error {
public:
    DependencyError(const std::string& format_name,
                    std::vector<std::string> missing,
                    std::vector<std::string> version_mismatches,
                    std::string remediation);

    const std::vector<std::string>& missing() const noexcept { return missing_; }
    const std::vector<std::string>& version_mismatches() const noexcept { return mismatches_; }
    const std::string& remediation() const noexcept { return remediation_; }

private:
    std::vector<std::string> missing_;
    std::vector<std::string> mismatches_;
    std::string remediation_;
};

/// A parser/renderer reference, version constraint or config value is unusable.
class POLYDOC_API ConfigurationError : public Error {
public:
    using Error::Error;
};

/// Options or transform parameters failed validation.
class POLYDOC_API ValidationError : public Error {
public:
    using Error::Error;
};

/// Malformed serialized AST or structural input failure.
class POLYDOC_API ParsingError : public Error {
public:
    using Error::Error;
};

/// Transform dependency graph has a cycle or names an unknown transform.
class POLYDOC_API DependencyResolutionError : public Error {
public:
    DependencyResolutionError(const std::string& message,
                              std::string subject,
                              std::vector<std::string> cycle = {})
        : Error(message, std::move(subject)), cycle_(std::move(cycle)) {}

    /// Cycle path with the first member repeated at the end; empty if not a cycle.
    const std::vector<std::string>& cycle() const noexcept { return cycle_; }

private:
    std::vector<std::string> cycle_;
};

} // namespace Polydoc
