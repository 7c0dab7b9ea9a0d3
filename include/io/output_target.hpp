#pragma once

#include <export.hpp>
#include <fstream>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace Polydoc {

/**
 * @brief Destination for a renderer: a file path (opened lazily, truncated)
 * or a caller-owned binary stream.
 */
class POLYDOC_API OutputTarget {
public:
    static OutputTarget to_path(std::string path);
    /// The stream must outlive the OutputTarget.
    static OutputTarget to_stream(std::ostream& out);

    OutputTarget(OutputTarget&&) noexcept;
    OutputTarget& operator=(OutputTarget&&) noexcept;
    ~OutputTarget();

    std::ostream& stream();
    void write(std::string_view data);
    /// @throws Error if the underlying stream reports a write failure.
    void flush();

    const std::optional<std::string>& path() const { return path_; }
    std::string describe() const { return path_ ? *path_ : "<stream>"; }

private:
    OutputTarget() = default;

    std::optional<std::string> path_;
    std::ostream* stream_ = nullptr;
    std::unique_ptr<std::ofstream> file_;
};

} // namespace Polydoc
