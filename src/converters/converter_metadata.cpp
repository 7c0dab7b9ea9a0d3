#include <converters/converter_metadata.hpp>
#include <core/errors.hpp>
#include <utils/strings.hpp>
#include <algorithm>

namespace Polydoc {

std::string normalize_mime(std::string_view mime) {
    auto semi = mime.find(';');
    return to_lower(trim(mime.substr(0, semi)));
}

bool ConverterMetadata::matches_extension(std::string_view filename) const {
    return std::any_of(extensions.begin(), extensions.end(), [filename](const std::string& ext) {
        return ends_with_ci(filename, ext);
    });
}

bool ConverterMetadata::matches_mime(std::string_view mime) const {
    std::string wanted = normalize_mime(mime);
    if (wanted.empty()) return false;
    return std::any_of(mime_types.begin(), mime_types.end(), [&wanted](const std::string& m) {
        return normalize_mime(m) == wanted;
    });
}

bool ConverterMetadata::matches_magic(std::string_view prefix) const {
    return std::any_of(magic_bytes.begin(), magic_bytes.end(), [prefix](const MagicPattern& m) {
        if (m.bytes.empty() || m.offset + m.bytes.size() > prefix.size()) return false;
        return prefix.compare(m.offset, m.bytes.size(), m.bytes) == 0;
    });
}

size_t ConverterMetadata::magic_span() const {
    size_t span = 0;
    for (const auto& m : magic_bytes) span = std::max(span, m.offset + m.bytes.size());
    return span;
}

void ConverterMetadata::validate() const {
    if (format_name.empty())
        throw ConfigurationError("Converter format_name must not be empty", "format_name");
    for (const auto& ext : extensions) {
        if (ext.size() < 2 || ext.front() != '.')
            throw ConfigurationError("Extension '" + ext + "' of format '" + format_name +
                                     "' must start with '.'", format_name);
    }
    for (const auto& m : magic_bytes) {
        if (m.bytes.empty())
            throw ConfigurationError("Empty magic pattern in format '" + format_name + "'", format_name);
    }
    if (priority < 0)
        throw ConfigurationError("Priority of format '" + format_name + "' must be non-negative", format_name);
}

std::string ConverterMetadata::remediation(const std::vector<std::string>& missing) const {
    if (!install_hint.empty()) return install_hint;
    if (missing.empty()) return {};
    return "Install or enable: " + join(missing, " ");
}

} // namespace Polydoc
