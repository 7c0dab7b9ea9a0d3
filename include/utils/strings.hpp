#pragma once

#include <export.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace Polydoc {

POLYDOC_API std::string to_lower(std::string_view s);
POLYDOC_API std::string trim(std::string_view s);
POLYDOC_API std::vector<std::string> split(std::string_view s, char sep);
POLYDOC_API std::string join(const std::vector<std::string>& parts, std::string_view sep);
POLYDOC_API bool ends_with_ci(std::string_view s, std::string_view suffix);
POLYDOC_API bool equals_ci(std::string_view a, std::string_view b);

/// Lowercase; punctuation dropped; whitespace/underscore runs become @p separator.
POLYDOC_API std::string slugify(std::string_view text, std::string_view separator = "-");

} // namespace Polydoc
