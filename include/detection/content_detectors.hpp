#pragma once

/**
 * @file content_detectors.hpp
 * @brief Capability interface for deep content inspection, plus reusable
 * detectors for the common cases.
 *
 * Detectors run only when cheaper signals leave more than one candidate, and
 * only ever see the input through a BoundedReader.
 */

#include <io/bounded_reader.hpp>
#include <export.hpp>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Polydoc {

class POLYDOC_API ContentDetector {
public:
    virtual ~ContentDetector() = default;
    virtual bool matches(BoundedReader& reader) const = 0;
    virtual std::string describe() const = 0;
};

using ContentDetectorPtr = std::shared_ptr<const ContentDetector>;

/**
 * @brief Matches ZIP containers holding every entry in @p required and, when
 * @p any_prefix is non-empty, at least one entry starting with one of those
 * prefixes (e.g. "word/" for docx).
 */
class POLYDOC_API ZipEntryDetector : public ContentDetector {
public:
    explicit ZipEntryDetector(std::vector<std::string> required,
                              std::vector<std::string> any_prefix = {});

    bool matches(BoundedReader& reader) const override;
    std::string describe() const override;

private:
    std::vector<std::string> required_;
    std::vector<std::string> any_prefix_;
};

/// Applies a predicate to the first @p prefix_bytes of the input.
class POLYDOC_API PrefixPredicateDetector : public ContentDetector {
public:
    using Predicate = std::function<bool(std::string_view)>;

    PrefixPredicateDetector(std::string name, size_t prefix_bytes, Predicate predicate);

    bool matches(BoundedReader& reader) const override;
    std::string describe() const override { return name_; }

private:
    std::string name_;
    size_t prefix_bytes_;
    Predicate predicate_;
};

/// A JSON object whose root carries a "node_type" field.
class POLYDOC_API AstJsonDetector : public ContentDetector {
public:
    bool matches(BoundedReader& reader) const override;
    std::string describe() const override { return "ast-json"; }
};

template <typename T, typename... Args>
ContentDetectorPtr make_detector(Args&&... args) {
    return std::make_shared<const T>(std::forward<Args>(args)...);
}

} // namespace Polydoc
