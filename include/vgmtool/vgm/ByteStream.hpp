#pragma once

#include "vgmtool/vgm/VgmError.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace vgmtool::vgm {

/// Bounds-checked little-endian cursor. A failed read reports BufferUnderflow
/// and leaves the position unchanged.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> data, std::size_t position = 0)
        : data_(data), position_(position) {}

    [[nodiscard]] std::size_t position() const { return position_; }
    [[nodiscard]] std::size_t size() const { return data_.size(); }
    [[nodiscard]] std::size_t remaining() const { return position_ < data_.size() ? data_.size() - position_ : 0; }
    [[nodiscard]] bool atEnd() const { return remaining() == 0; }
    [[nodiscard]] std::span<const std::uint8_t> data() const { return data_; }

    VgmResult<std::uint8_t> peekU8() const;
    VgmResult<std::uint8_t> readU8();
    VgmResult<std::uint16_t> readU16();
    VgmResult<std::uint16_t> readU16Be();
    VgmResult<std::uint32_t> readU24();
    VgmResult<std::uint32_t> readU32();
    VgmResult<std::uint32_t> readU32Be();
    VgmResult<std::vector<std::uint8_t>> readBytes(std::size_t count);
    VgmResult<void> skip(std::size_t count);
    VgmResult<void> seek(std::size_t position);

private:
    VgmResult<void> require(std::size_t count) const;

    std::span<const std::uint8_t> data_;
    std::size_t position_ = 0;
};

class ByteWriter {
public:
    ByteWriter() = default;
    explicit ByteWriter(std::vector<std::uint8_t>& out) : out_(&out) {}

    [[nodiscard]] std::size_t size() const { return buffer().size(); }
    [[nodiscard]] const std::vector<std::uint8_t>& bytes() const { return buffer(); }
    std::vector<std::uint8_t> take() { return std::move(buffer()); }

    void writeU8(std::uint8_t value);
    void writeU16(std::uint16_t value);
    void writeU16Be(std::uint16_t value);
    void writeU24(std::uint32_t value);
    void writeU32(std::uint32_t value);
    void writeU32Be(std::uint32_t value);
    void writeBytes(std::span<const std::uint8_t> bytes);
    /// Zero-fills up to absolute position `position`; no-op if already there.
    void padTo(std::size_t position);
    /// Overwrites four bytes at `position`, which must already be written.
    VgmResult<void> patchU32(std::size_t position, std::uint32_t value);

private:
    std::vector<std::uint8_t>& buffer() { return out_ != nullptr ? *out_ : owned_; }
    const std::vector<std::uint8_t>& buffer() const { return out_ != nullptr ? *out_ : owned_; }

    std::vector<std::uint8_t> owned_;
    std::vector<std::uint8_t>* out_ = nullptr;
};

}  // namespace vgmtool::vgm
