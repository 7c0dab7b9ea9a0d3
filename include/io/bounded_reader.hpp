#pragma once

/**
 * @file bounded_reader.hpp
 * @brief Byte-budgeted random-access view handed to content detectors.
 *
 * The budget caps the total number of bytes served; requests past it return
 * truncated data instead of failing, so a detector can never force a full
 * read of a large input. For inputs of unknown size (streams) reads ending
 * past the budget are truncated at it as well, since reaching an offset
 * means buffering everything before it.
 */

#include <io/input_source.hpp>
#include <export.hpp>
#include <optional>
#include <string>

namespace Polydoc {

class POLYDOC_API BoundedReader {
public:
    BoundedReader(InputSource& source, size_t budget);

    /// Up to @p len bytes at @p offset, truncated by the remaining budget.
    std::string read(size_t offset, size_t len);

    std::string prefix(size_t len) { return read(0, len); }

    /// Input size if known cheaply (file or byte buffer).
    std::optional<size_t> size() { return source_.size(); }

    const std::optional<std::string>& filename() const { return source_.filename(); }

    size_t budget() const { return budget_; }
    size_t remaining() const { return budget_ - consumed_; }
    bool exhausted() const { return consumed_ >= budget_; }

private:
    InputSource& source_;
    size_t budget_;
    size_t consumed_ = 0;
};

} // namespace Polydoc
