#pragma once

/**
 * @file zip_directory.hpp
 * @brief Lists ZIP entry names without decompressing anything.
 *
 * Used to tell apart container formats that share the PK magic (docx, xlsx,
 * pptx, epub, odt, ...). All reads go through a BoundedReader.
 */

#include <io/bounded_reader.hpp>
#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Polydoc {

struct ZipListing {
    std::vector<std::string> entries;
    /// False when the budget or a truncated directory cut the listing short.
    bool complete = false;
    /// True when names came from the central directory rather than local headers.
    bool from_central_directory = false;
};

/// "PK\x03\x04" (local header) or "PK\x05\x06" (empty archive).
POLYDOC_API bool has_zip_signature(std::string_view prefix);

/**
 * @brief Reads entry names from the central directory when the input size is
 * known, otherwise walks local file headers from the start.
 * Malformed archives yield whatever entries were readable.
 */
POLYDOC_API ZipListing list_zip_entries(BoundedReader& reader);

} // namespace Polydoc
