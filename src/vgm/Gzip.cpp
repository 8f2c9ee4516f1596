#include "vgmtool/vgm/Gzip.hpp"

#include "vgmtool/vgm/VgmHeader.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <format>
#include <string>

namespace vgmtool::vgm {
namespace {

constexpr std::array<std::uint8_t, 2> kGzipMagic{0x1F, 0x8B};
// 15-bit window plus 32: let zlib detect the gzip or zlib wrapper.
constexpr int kInflateWindowBits = 15 + 32;
// 15-bit window plus 16: write a gzip wrapper.
constexpr int kDeflateWindowBits = 15 + 16;
constexpr std::size_t kChunkSize = 64 * 1024;

VgmError zlibError(std::string_view operation, int code, const z_stream& stream) {
    const char* detail = stream.msg != nullptr ? stream.msg : zError(code);
    return VgmError::invalidDataFormat("gzip", std::format("{} failed ({}): {}", operation, code, detail));
}

// Ends the zlib stream on every exit path.
class InflateStream {
public:
    InflateStream() = default;
    ~InflateStream() {
        if (initialized_) {
            inflateEnd(&stream_);
        }
    }
    InflateStream(const InflateStream&) = delete;
    InflateStream& operator=(const InflateStream&) = delete;

    int init() {
        const int rc = inflateInit2(&stream_, kInflateWindowBits);
        initialized_ = rc == Z_OK;
        return rc;
    }
    z_stream& get() { return stream_; }

private:
    z_stream stream_{};
    bool initialized_ = false;
};

class DeflateStream {
public:
    DeflateStream() = default;
    ~DeflateStream() {
        if (initialized_) {
            deflateEnd(&stream_);
        }
    }
    DeflateStream(const DeflateStream&) = delete;
    DeflateStream& operator=(const DeflateStream&) = delete;

    int init(int level) {
        const int rc = deflateInit2(&stream_, level, Z_DEFLATED, kDeflateWindowBits, 8, Z_DEFAULT_STRATEGY);
        initialized_ = rc == Z_OK;
        return rc;
    }
    z_stream& get() { return stream_; }

private:
    z_stream stream_{};
    bool initialized_ = false;
};

VgmResult<std::vector<std::uint8_t>> inflateGzip(std::span<const std::uint8_t> bytes, std::size_t maxInflatedSize) {
    InflateStream inflater;
    z_stream& stream = inflater.get();
    if (const int rc = inflater.init(); rc != Z_OK) {
        return std::unexpected(zlibError("inflateInit2", rc, stream));
    }

    stream.next_in = const_cast<Bytef*>(bytes.data());
    stream.avail_in = static_cast<uInt>(bytes.size());

    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, kChunkSize> chunk{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = inflate(&stream, Z_NO_FLUSH);
        if (rc != Z_OK && rc != Z_STREAM_END) {
            return std::unexpected(zlibError("inflate", rc, stream));
        }
        const std::size_t produced = chunk.size() - stream.avail_out;
        if (out.size() + produced > maxInflatedSize) {
            return std::unexpected(
                VgmError::dataSizeExceedsLimit("decompressed_file_size", out.size() + produced, maxInflatedSize));
        }
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
        if (rc == Z_OK && produced == 0 && stream.avail_in == 0) {
            return std::unexpected(VgmError::invalidDataFormat("gzip", "truncated gzip stream"));
        }
    }
    return out;
}

}  // namespace

bool isVgmData(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= kVgmMagic.size() && std::equal(kVgmMagic.begin(), kVgmMagic.end(), bytes.begin());
}

bool isGzipData(std::span<const std::uint8_t> bytes) {
    return bytes.size() >= kGzipMagic.size() && std::equal(kGzipMagic.begin(), kGzipMagic.end(), bytes.begin());
}

VgmResult<std::vector<std::uint8_t>> detectAndDecompress(std::span<const std::uint8_t> bytes,
                                                         std::size_t maxInflatedSize) {
    if (isVgmData(bytes)) {
        return std::vector<std::uint8_t>(bytes.begin(), bytes.end());
    }
    if (!isGzipData(bytes)) {
        return std::unexpected(VgmError::invalidDataFormat("file", "neither VGM nor gzip magic found"));
    }

    auto inflated = inflateGzip(bytes, maxInflatedSize);
    if (!inflated) {
        return inflated;
    }
    if (!isVgmData(*inflated)) {
        const std::size_t shown = std::min<std::size_t>(inflated->size(), kVgmMagic.size());
        return std::unexpected(
            VgmError::invalidMagic(kVgmMagic, std::string(inflated->begin(), inflated->begin() + shown), 0));
    }
    return inflated;
}

VgmResult<std::vector<std::uint8_t>> compressGzip(std::span<const std::uint8_t> bytes, int level) {
    DeflateStream deflater;
    z_stream& stream = deflater.get();
    if (const int rc = deflater.init(level); rc != Z_OK) {
        return std::unexpected(zlibError("deflateInit2", rc, stream));
    }

    stream.next_in = const_cast<Bytef*>(bytes.data());
    stream.avail_in = static_cast<uInt>(bytes.size());

    std::vector<std::uint8_t> out;
    std::array<std::uint8_t, kChunkSize> chunk{};
    int rc = Z_OK;
    while (rc != Z_STREAM_END) {
        stream.next_out = chunk.data();
        stream.avail_out = static_cast<uInt>(chunk.size());
        rc = deflate(&stream, Z_FINISH);
        if (rc != Z_OK && rc != Z_STREAM_END && rc != Z_BUF_ERROR) {
            return std::unexpected(zlibError("deflate", rc, stream));
        }
        const std::size_t produced = chunk.size() - stream.avail_out;
        out.insert(out.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(produced));
    }
    return out;
}

}  // namespace vgmtool::vgm
