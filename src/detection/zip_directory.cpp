#include <detection/zip_directory.hpp>
#include <algorithm>
#include <cstdint>

namespace Polydoc {

namespace {

constexpr uint32_t kLocalHeaderSig = 0x04034b50;
constexpr uint32_t kCentralHeaderSig = 0x02014b50;
constexpr uint32_t kEndOfCentralDirSig = 0x06054b50;
constexpr size_t kEocdMinSize = 22;
constexpr size_t kMaxCommentSize = 0xFFFF;
constexpr size_t kLocalHeaderSize = 30;
constexpr size_t kCentralHeaderSize = 46;

uint16_t le16(std::string_view b, size_t at) {
    return static_cast<uint16_t>(static_cast<uint8_t>(b[at]) |
                                 (static_cast<uint8_t>(b[at + 1]) << 8));
}

uint32_t le32(std::string_view b, size_t at) {
    return static_cast<uint32_t>(le16(b, at)) | (static_cast<uint32_t>(le16(b, at + 2)) << 16);
}

bool read_central_directory(BoundedReader& reader, size_t total, ZipListing& out) {
    size_t tail_len = std::min(total, kEocdMinSize + kMaxCommentSize);
    std::string tail = reader.read(total - tail_len, tail_len);
    if (tail.size() < kEocdMinSize) return false;

    size_t eocd = std::string::npos;
    for (size_t i = tail.size() - kEocdMinSize + 1; i-- > 0;) {
        if (le32(tail, i) == kEndOfCentralDirSig) {
            eocd = i;
            break;
        }
    }
    if (eocd == std::string::npos) return false;

    uint16_t count = le16(tail, eocd + 10);
    uint32_t cd_size = le32(tail, eocd + 12);
    uint32_t cd_offset = le32(tail, eocd + 16);
    if (static_cast<size_t>(cd_offset) + cd_size > total) return false;

    std::string cd = reader.read(cd_offset, cd_size);
    out.from_central_directory = true;

    size_t pos = 0;
    for (uint16_t i = 0; i < count; ++i) {
        if (pos + kCentralHeaderSize > cd.size() || le32(cd, pos) != kCentralHeaderSig) return true;
        uint16_t name_len = le16(cd, pos + 28);
        uint16_t extra_len = le16(cd, pos + 30);
        uint16_t comment_len = le16(cd, pos + 32);
        if (pos + kCentralHeaderSize + name_len > cd.size()) return true;
        out.entries.emplace_back(cd.substr(pos + kCentralHeaderSize, name_len));
        pos += kCentralHeaderSize + name_len + extra_len + comment_len;
    }
    out.complete = true;
    return true;
}

void walk_local_headers(BoundedReader& reader, ZipListing& out) {
    size_t offset = 0;
    while (!reader.exhausted() && offset < reader.budget()) {
        std::string header = reader.read(offset, kLocalHeaderSize);
        if (header.size() < kLocalHeaderSize) return;
        uint32_t sig = le32(header, 0);
        if (sig == kCentralHeaderSig || sig == kEndOfCentralDirSig) {
            out.complete = true;
            return;
        }
        if (sig != kLocalHeaderSig) return;

        uint16_t flags = le16(header, 6);
        uint32_t compressed = le32(header, 18);
        uint16_t name_len = le16(header, 26);
        uint16_t extra_len = le16(header, 28);

        std::string name = reader.read(offset + kLocalHeaderSize, name_len);
        if (name.size() < name_len) return;
        out.entries.push_back(std::move(name));

        // Sizes live in a trailing data descriptor; the next header can't be located.
        if ((flags & 0x08) && compressed == 0) return;

        offset += kLocalHeaderSize + name_len + extra_len + compressed;
    }
}

} // namespace

bool has_zip_signature(std::string_view prefix) {
    if (prefix.size() < 4) return false;
    uint32_t sig = le32(prefix, 0);
    return sig == kLocalHeaderSig || sig == kEndOfCentralDirSig;
}

ZipListing list_zip_entries(BoundedReader& reader) {
    ZipListing listing;
    if (!has_zip_signature(reader.prefix(4))) return listing;

    if (auto total = reader.size(); total && *total >= kEocdMinSize) {
        if (read_central_directory(reader, *total, listing)) return listing;
        listing = ZipListing{};
    }
    walk_local_headers(reader, listing);
    return listing;
}

} // namespace Polydoc
