#pragma once

/**
 * @file converter_registry.hpp
 * @brief Registry of format converters and the multi-signal format detector.
 *
 * Registration and lookups are thread-safe. Detection takes a snapshot of the
 * registered metadata under a shared lock and then performs all I/O without
 * holding it, so slow inputs never block registration.
 *
 * Detection order:
 *   1. explicit format name
 *   2. filename extension, MIME type and magic bytes on a bounded prefix,
 *      intersected; on conflict magic beats MIME beats extension
 *   3. content detectors on whatever is still ambiguous
 *   4. priority (descending), then registration order
 * With no signal at all, only the content detectors of formats that declare
 * no magic bytes are consulted, and only against the prefix.
 */

#include <converters/converter_metadata.hpp>
#include <converters/dependency_checker.hpp>
#include <core/config.hpp>
#include <io/input_source.hpp>
#include <export.hpp>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace Polydoc {

struct DetectionResult {
    std::string format_name;
    /// Signal that settled the choice: "explicit", "extension", "mime",
    /// "magic", "content" or "priority".
    std::string decided_by;
    /// Candidate set before the final priority pick.
    std::vector<std::string> candidates;
};

class POLYDOC_API ConverterRegistry {
public:
    explicit ConverterRegistry(RuntimeConfig config = {});

    /// Shared instance with the built-in converters registered.
    static ConverterRegistry& global();

    // =========================================================================
    //  Registration
    // =========================================================================

    /// Overwrites (with a warning) an existing format of the same name.
    /// @throws ConfigurationError if the metadata is malformed.
    void register_converter(ConverterMetadata meta);
    bool unregister(const std::string& format_name);

    /// Named factories targeted by string parser/renderer references.
    /// Qualified names take the form "<namespace>::<Name>".
    void register_parser_factory(const std::string& qualified_name, ParserFactory factory);
    void register_renderer_factory(const std::string& qualified_name, RendererFactory factory);

    void clear();

    // =========================================================================
    //  Lookup
    // =========================================================================

    bool has_format(const std::string& format_name) const;
    std::vector<std::string> list_formats() const;
    std::shared_ptr<const ConverterMetadata> get_format_info(const std::string& format_name) const;
    std::vector<std::string> formats_for_extension(const std::string& filename) const;
    bool can_parse(const std::string& format_name) const;
    bool can_render(const std::string& format_name) const;
    /// Formats with a renderer, sorted.
    std::vector<std::string> supported_targets() const;

    // =========================================================================
    //  Detection
    // =========================================================================

    /// @throws FormatDetectionError naming the input when nothing fits.
    DetectionResult detect(InputSource& input,
                           const std::optional<std::string>& explicit_format = std::nullopt) const;

    std::string detect_format(InputSource& input,
                              const std::optional<std::string>& explicit_format = std::nullopt) const {
        return detect(input, explicit_format).format_name;
    }

    // =========================================================================
    //  Parser / renderer construction
    // =========================================================================

    /// @throws FormatDetectionError for an unknown format, ConfigurationError
    ///         when the reference cannot be resolved, DependencyError when a
    ///         required feature is missing.
    ParserPtr create_parser(const std::string& format_name, const json& options = json::object()) const;
    RendererPtr create_renderer(const std::string& format_name, const json& options = json::object()) const;

    /// Unmet requirements per format as "name>=x" strings (parser and
    /// renderer combined). Formats with nothing missing are omitted.
    std::map<std::string, std::vector<std::string>>
    check_dependencies(const std::optional<std::string>& format_name = std::nullopt) const;

    // =========================================================================
    //  Configuration
    // =========================================================================

    void set_config(RuntimeConfig config);
    RuntimeConfig config() const;

    void set_feature_registry(FeatureRegistry& features);
    FeatureRegistry& features() const;

private:
    struct Entry {
        std::shared_ptr<const ConverterMetadata> meta;
        uint64_t sequence = 0;
    };

    std::vector<Entry> snapshot() const;
    std::shared_ptr<const ConverterMetadata> require_format(const std::string& format_name) const;
    ParserFactory resolve_parser(const ConverterMetadata& meta) const;
    RendererFactory resolve_renderer(const ConverterMetadata& meta) const;

    mutable std::shared_mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, ParserFactory> parser_factories_;
    std::map<std::string, RendererFactory> renderer_factories_;
    uint64_t next_sequence_ = 0;
    RuntimeConfig config_;
    FeatureRegistry* features_;
};

} // namespace Polydoc
