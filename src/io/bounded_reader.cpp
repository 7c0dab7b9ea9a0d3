#include <io/bounded_reader.hpp>
#include <algorithm>

namespace Polydoc {

BoundedReader::BoundedReader(InputSource& source, size_t budget)
    : source_(source), budget_(budget) {}

std::string BoundedReader::read(size_t offset, size_t len) {
    len = std::min(len, remaining());
    // Size unknown: a forward-only stream buffers every byte before offset too.
    if (!source_.size()) {
        if (offset >= budget_) return {};
        len = std::min(len, budget_ - offset);
    }
    if (len == 0) return {};
    std::string out = source_.read_range(offset, len);
    consumed_ += out.size();
    return out;
}

} // namespace Polydoc
