#include <core/errors.hpp>
#include <sstream>

namespace Polydoc {

namespace {

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += items[i];
    }
    return out;
}

std::string describe(const std::string& format_name,
                     const std::vector<std::string>& missing,
                     const std::vector<std::string>& mismatches,
                     const std::string& remediation) {
    std::ostringstream ss;
    ss << "Format '" << format_name << "' is unavailable";
    if (!missing.empty()) ss << "; missing: " << join(missing);
    if (!mismatches.empty()) ss << "; version mismatch: " << join(mismatches);
    if (!remediation.empty()) ss << ". " << remediation;
    return ss.str();
}

} // namespace

DependencyError::DependencyError(const std::string& format_name,
                                 std::vector<std::string> missing,
                                 std::vector<std::string> version_mismatches,
                                 std::string remediation)
    : Error(describe(format_name, missing, version_mismatches, remediation), format_name),
      missing_(std::move(missing)),
      mismatches_(std::move(version_mismatches)),
      remediation_(std::move(remediation)) {}

} // namespace Polydoc
