#include "vgmtool/vgm/BitReader.hpp"

#include <algorithm>
#include <format>

namespace vgmtool::vgm {

VgmResult<std::uint16_t> BitReader::readBits(std::uint8_t count) {
    constexpr std::uint8_t kMaxBits = 16;
    if (count > kMaxBits) {
        return std::unexpected(VgmError::invalidDataFormat(
            "bit_count", std::format("Cannot read more than {} bits at once, requested: {}", kMaxBits, count)));
    }
    if (count > bitsRemaining()) {
        return std::unexpected(VgmError::bufferUnderflow(bytePos_, (count + 7u) / 8u,
                                                         data_.size() - std::min(bytePos_, data_.size())));
    }

    std::uint16_t result = 0;
    std::uint8_t bitsRead = 0;
    while (bitsRead < count) {
        const std::uint8_t current = data_[bytePos_];
        const std::uint8_t bitsAvailable = static_cast<std::uint8_t>(8 - bitPos_);
        const std::uint8_t bitsToRead =
            std::min<std::uint8_t>(static_cast<std::uint8_t>(count - bitsRead), bitsAvailable);

        const auto mask = static_cast<std::uint8_t>((1u << bitsToRead) - 1u);
        const auto shift = static_cast<std::uint8_t>(bitsAvailable - bitsToRead);
        const auto bits = static_cast<std::uint8_t>((current >> shift) & mask);

        result = static_cast<std::uint16_t>((result << bitsToRead) | bits);
        bitsRead = static_cast<std::uint8_t>(bitsRead + bitsToRead);

        bitPos_ = static_cast<std::uint8_t>(bitPos_ + bitsToRead);
        if (bitPos_ >= 8) {
            bitPos_ = 0;
            ++bytePos_;
        }
    }
    return result;
}

}  // namespace vgmtool::vgm
