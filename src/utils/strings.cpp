#include <utils/strings.hpp>
#include <cctype>

namespace Polydoc {

std::string to_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::string trim(std::string_view s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return std::string(s.substr(b, e - b));
}

std::vector<std::string> split(std::string_view s, char sep) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(s.substr(start));
            break;
        }
        parts.emplace_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, std::string_view sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i) out += sep;
        out += parts[i];
    }
    return out;
}

bool equals_ci(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

bool ends_with_ci(std::string_view s, std::string_view suffix) {
    if (suffix.size() > s.size()) return false;
    return equals_ci(s.substr(s.size() - suffix.size()), suffix);
}

std::string slugify(std::string_view text, std::string_view separator) {
    std::string out;
    bool pending_sep = false;
    for (char ch : text) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c) || c == '_') {
            pending_sep = true;
            continue;
        }
        if (!(std::isalnum(c) || c == '-' || c >= 0x80)) continue;
        if (pending_sep && !out.empty()) out += separator;
        pending_sep = false;
        out += static_cast<char>(std::tolower(c));
    }

    // Strip separators from both ends.
    if (!separator.empty()) {
        while (out.size() >= separator.size() && out.compare(0, separator.size(), separator) == 0)
            out.erase(0, separator.size());
        while (out.size() >= separator.size() &&
               out.compare(out.size() - separator.size(), separator.size(), separator) == 0)
            out.erase(out.size() - separator.size());
    }
    return out;
}

} // namespace Polydoc
