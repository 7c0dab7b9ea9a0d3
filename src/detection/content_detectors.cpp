#include <detection/content_detectors.hpp>
#include <detection/zip_directory.hpp>
#include <utils/strings.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>

namespace Polydoc {

// =============================================================================
//  ZipEntryDetector
// =============================================================================

ZipEntryDetector::ZipEntryDetector(std::vector<std::string> required,
                                   std::vector<std::string> any_prefix)
    : required_(std::move(required)), any_prefix_(std::move(any_prefix)) {}

bool ZipEntryDetector::matches(BoundedReader& reader) const {
    ZipListing listing = list_zip_entries(reader);
    if (listing.entries.empty()) return false;

    for (const auto& name : required_) {
        if (std::find(listing.entries.begin(), listing.entries.end(), name) == listing.entries.end())
            return false;
    }
    if (any_prefix_.empty()) return true;

    return std::any_of(listing.entries.begin(), listing.entries.end(), [this](const std::string& e) {
        return std::any_of(any_prefix_.begin(), any_prefix_.end(), [&e](const std::string& p) {
            return e.compare(0, p.size(), p) == 0;
        });
    });
}

std::string ZipEntryDetector::describe() const {
    std::vector<std::string> parts = required_;
    for (const auto& p : any_prefix_) parts.push_back(p + "*");
    return "zip[" + join(parts, ",") + "]";
}

// =============================================================================
//  PrefixPredicateDetector
// =============================================================================

PrefixPredicateDetector::PrefixPredicateDetector(std::string name, size_t prefix_bytes,
                                                 Predicate predicate)
    : name_(std::move(name)), prefix_bytes_(prefix_bytes), predicate_(std::move(predicate)) {}

bool PrefixPredicateDetector::matches(BoundedReader& reader) const {
    return predicate_(reader.prefix(prefix_bytes_));
}

// =============================================================================
//  AstJsonDetector
// =============================================================================

bool AstJsonDetector::matches(BoundedReader& reader) const {
    std::string head = reader.prefix(reader.budget());
    if (head.size() >= 3 && head.compare(0, 3, "\xEF\xBB\xBF") == 0) head.erase(0, 3);

    auto first = std::find_if_not(head.begin(), head.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    if (first == head.end() || *first != '{') return false;

    auto parsed = nlohmann::json::parse(head, nullptr, /*allow_exceptions=*/false);
    if (!parsed.is_discarded()) return parsed.is_object() && parsed.contains("node_type");

    // Truncated by the budget: fall back to a textual probe.
    return reader.exhausted() && head.find("\"node_type\"") != std::string::npos;
}

} // namespace Polydoc
