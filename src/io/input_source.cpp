#include <io/input_source.hpp>
#include <core/errors.hpp>
#include <algorithm>
#include <filesystem>
#include <istream>
#include <limits>
#include <system_error>

namespace Polydoc {

namespace {
constexpr size_t kStreamChunk = 64 * 1024;

size_t saturating_add(size_t a, size_t b) {
    return a > std::numeric_limits<size_t>::max() - b ? std::numeric_limits<size_t>::max() : a + b;
}
} // namespace

InputSource InputSource::from_path(std::string path, std::optional<std::string> mime_type) {
    InputSource src;
    src.kind_ = Kind::Path;
    src.filename_ = std::move(path);
    src.mime_type_ = std::move(mime_type);
    return src;
}

InputSource InputSource::from_bytes(std::string bytes,
                                    std::optional<std::string> filename,
                                    std::optional<std::string> mime_type) {
    InputSource src;
    src.kind_ = Kind::Bytes;
    src.bytes_ = std::move(bytes);
    src.filename_ = std::move(filename);
    src.mime_type_ = std::move(mime_type);
    return src;
}

InputSource InputSource::from_stream(std::istream& in,
                                     std::optional<std::string> filename,
                                     std::optional<std::string> mime_type) {
    InputSource src;
    src.kind_ = Kind::Stream;
    src.stream_ = &in;
    src.filename_ = std::move(filename);
    src.mime_type_ = std::move(mime_type);
    return src;
}

InputSource::InputSource(InputSource&&) noexcept = default;
InputSource& InputSource::operator=(InputSource&&) noexcept = default;
InputSource::~InputSource() = default;

std::string InputSource::describe() const {
    switch (kind_) {
        case Kind::Path:   return *filename_;
        case Kind::Bytes:  return filename_ ? *filename_ : "<bytes: " + std::to_string(bytes_.size()) + ">";
        case Kind::Stream: return filename_ ? *filename_ : "<stream>";
    }
    return "<input>";
}

std::ifstream& InputSource::file() {
    if (!file_) {
        file_ = std::make_unique<std::ifstream>(*filename_, std::ios::binary);
        if (!*file_) {
            file_.reset();
            throw Error("Cannot open input file: " + *filename_, *filename_);
        }
    }
    return *file_;
}

void InputSource::ensure_buffered(size_t upto) {
    while (!stream_eof_ && bytes_.size() < upto) {
        size_t want = std::min(kStreamChunk, upto - bytes_.size());
        size_t old = bytes_.size();
        bytes_.resize(old + want);
        stream_->read(bytes_.data() + old, static_cast<std::streamsize>(want));
        size_t got = static_cast<size_t>(stream_->gcount());
        bytes_.resize(old + got);
        bytes_read_ += got;
        if (got < want) stream_eof_ = true;
    }
}

std::string InputSource::read_prefix(size_t n) {
    return read_range(0, n);
}

std::string InputSource::read_range(size_t offset, size_t len) {
    switch (kind_) {
        case Kind::Bytes: {
            if (offset >= bytes_.size()) return {};
            std::string out = bytes_.substr(offset, len);
            bytes_read_ += out.size();
            return out;
        }
        case Kind::Stream: {
            ensure_buffered(saturating_add(offset, len));
            if (offset >= bytes_.size()) return {};
            return bytes_.substr(offset, len);
        }
        case Kind::Path: {
            auto total = size();
            if (!total || offset >= *total) return {};
            len = std::min(len, *total - offset);
            auto& in = file();
            in.clear();
            in.seekg(static_cast<std::streamoff>(offset));
            if (!in) return {};
            std::string out(len, '\0');
            in.read(out.data(), static_cast<std::streamsize>(len));
            out.resize(static_cast<size_t>(in.gcount()));
            bytes_read_ += out.size();
            return out;
        }
    }
    return {};
}

std::string InputSource::read_all() {
    switch (kind_) {
        case Kind::Bytes:
            bytes_read_ += bytes_.size();
            return bytes_;
        case Kind::Stream:
            ensure_buffered(std::numeric_limits<size_t>::max());
            return bytes_;
        case Kind::Path: {
            auto total = size();
            return read_range(0, total ? *total : 0);
        }
    }
    return {};
}

std::optional<size_t> InputSource::size() {
    switch (kind_) {
        case Kind::Bytes:
            return bytes_.size();
        case Kind::Stream:
            if (stream_eof_) return bytes_.size();
            return std::nullopt;
        case Kind::Path: {
            std::error_code ec;
            auto sz = std::filesystem::file_size(*filename_, ec);
            if (ec) throw Error("Cannot stat input file: " + *filename_ + ": " + ec.message(), *filename_);
            return static_cast<size_t>(sz);
        }
    }
    return std::nullopt;
}

} // namespace Polydoc
