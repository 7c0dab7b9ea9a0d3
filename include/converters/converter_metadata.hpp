#pragma once

/**
 * @file converter_metadata.hpp
 * @brief Everything the registry knows about one format: detection signals,
 * parser/renderer references and optional dependencies.
 */

#include <converters/parser.hpp>
#include <converters/renderer.hpp>
#include <detection/content_detectors.hpp>
#include <export.hpp>
#include <set>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Polydoc {

struct MagicPattern {
    std::string bytes;
    size_t offset = 0;
};

/// (install name, probe name, version constraint). Constraint may be empty.
struct DependencySpec {
    std::string install_name;
    std::string probe_name;
    std::string version_constraint;
};

/**
 * A parser or renderer is either a factory or a name resolved through the
 * registry's factory table. Bare names resolve under "<format_name>::".
 */
using ParserRef = std::variant<std::monostate, ParserFactory, std::string>;
using RendererRef = std::variant<std::monostate, RendererFactory, std::string>;

struct POLYDOC_API ConverterMetadata {
    std::string format_name;
    std::set<std::string> extensions;        // with leading dot: ".docx"
    std::set<std::string> mime_types;
    std::vector<MagicPattern> magic_bytes;
    ContentDetectorPtr content_detector;

    ParserRef parser;
    RendererRef renderer;
    std::vector<DependencySpec> parser_required_packages;
    std::vector<DependencySpec> renderer_required_packages;

    int priority = 0;
    std::string description;
    /// Overrides the generated remediation hint when non-empty.
    std::string install_hint;

    bool matches_extension(std::string_view filename) const;
    bool matches_mime(std::string_view mime) const;
    bool matches_magic(std::string_view prefix) const;

    /// Largest offset + length over all magic patterns.
    size_t magic_span() const;

    bool has_parser() const { return !std::holds_alternative<std::monostate>(parser); }
    bool has_renderer() const { return !std::holds_alternative<std::monostate>(renderer); }

    /// @throws ConfigurationError for an empty name, an extension without a
    ///         leading dot or an empty magic pattern.
    void validate() const;

    std::string remediation(const std::vector<std::string>& missing) const;
};

/// Lowercase, with any ";param" suffix stripped.
POLYDOC_API std::string normalize_mime(std::string_view mime);

} // namespace Polydoc
