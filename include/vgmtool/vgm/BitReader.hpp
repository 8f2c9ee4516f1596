#pragma once

#include "vgmtool/vgm/VgmError.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace vgmtool::vgm {

/// Reads MSB-first bit fields of up to 16 bits from a byte slice.
class BitReader {
public:
    explicit BitReader(std::span<const std::uint8_t> data) : data_(data) {}

    VgmResult<std::uint16_t> readBits(std::uint8_t count);

    [[nodiscard]] std::size_t bytePosition() const { return bytePos_; }
    [[nodiscard]] std::uint8_t bitPosition() const { return bitPos_; }
    [[nodiscard]] std::size_t bitsRemaining() const {
        return bytePos_ >= data_.size() ? 0 : (data_.size() - bytePos_) * 8 - bitPos_;
    }

private:
    std::span<const std::uint8_t> data_;
    std::size_t bytePos_ = 0;
    std::uint8_t bitPos_ = 0;
};

}  // namespace vgmtool::vgm
