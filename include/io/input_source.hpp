#pragma once

/**
 * @file input_source.hpp
 * @brief Uniform access to a document given as a path, a byte buffer or a stream.
 *
 * Reads are random-access by offset. Stream inputs are buffered forward-only
 * as far as the furthest requested byte, so detection on a large stream only
 * ever pulls its bounded prefix. bytes_read() reports how many bytes have been
 * transferred from the underlying medium.
 */

#include <export.hpp>
#include <cstddef>
#include <fstream>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

namespace Polydoc {

class POLYDOC_API InputSource {
public:
    enum class Kind { Path, Bytes, Stream };

    static InputSource from_path(std::string path,
                                 std::optional<std::string> mime_type = std::nullopt);
    static InputSource from_bytes(std::string bytes,
                                  std::optional<std::string> filename = std::nullopt,
                                  std::optional<std::string> mime_type = std::nullopt);
    /// The stream must outlive the InputSource.
    static InputSource from_stream(std::istream& in,
                                   std::optional<std::string> filename = std::nullopt,
                                   std::optional<std::string> mime_type = std::nullopt);

    InputSource(InputSource&&) noexcept;
    InputSource& operator=(InputSource&&) noexcept;
    InputSource(const InputSource&) = delete;
    InputSource& operator=(const InputSource&) = delete;
    ~InputSource();

    Kind kind() const { return kind_; }

    /// Path for file inputs, otherwise the filename hint.
    const std::optional<std::string>& filename() const { return filename_; }
    const std::optional<std::string>& mime_type() const { return mime_type_; }
    void set_mime_type(std::string mime) { mime_type_ = std::move(mime); }

    /// Human readable name for error messages.
    std::string describe() const;

    /// Up to @p n bytes from the start.
    std::string read_prefix(size_t n);

    /// Up to @p len bytes starting at @p offset; shorter at end of input.
    std::string read_range(size_t offset, size_t len);

    /// Entire content.
    std::string read_all();

    /// Total size when it can be known without reading the whole input.
    std::optional<size_t> size();

    size_t bytes_read() const { return bytes_read_; }

private:
    InputSource() = default;

    void ensure_buffered(size_t upto);
    std::ifstream& file();

    Kind kind_ = Kind::Bytes;
    std::optional<std::string> filename_;
    std::optional<std::string> mime_type_;

    std::string bytes_;                    // Bytes: content. Stream: buffered head.
    std::istream* stream_ = nullptr;
    bool stream_eof_ = false;
    std::unique_ptr<std::ifstream> file_;
    size_t bytes_read_ = 0;
};

} // namespace Polydoc
