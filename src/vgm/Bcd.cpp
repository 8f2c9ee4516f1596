#include "vgmtool/vgm/Bcd.hpp"

#include <format>

namespace vgmtool::vgm {

VgmResult<std::uint32_t> bcdFromBytes(std::span<const std::uint8_t> bytes) {
    if (bytes.size() > 4) {
        return std::unexpected(VgmError::invalidBcd("version", std::format("{} bytes exceed 4", bytes.size())));
    }

    std::uint32_t value = 0;
    for (auto it = bytes.rbegin(); it != bytes.rend(); ++it) {
        const std::uint8_t hi = static_cast<std::uint8_t>(*it >> 4);
        const std::uint8_t lo = static_cast<std::uint8_t>(*it & 0x0F);
        if (hi > 9 || lo > 9) {
            return std::unexpected(VgmError::invalidBcd("version", std::format("byte 0x{:02X} is not BCD", *it)));
        }
        value = value * 100 + hi * 10u + lo;
    }
    return value;
}

VgmResult<std::array<std::uint8_t, 4>> decimalToBcd(std::uint32_t value) {
    constexpr std::uint32_t kMaxBcdValue = 99'999'999;
    if (value > kMaxBcdValue) {
        return std::unexpected(
            VgmError::integerOverflow("BCD encoding", std::format("{} does not fit in 8 BCD digits", value)));
    }

    std::array<std::uint8_t, 4> out{};
    for (auto& byte : out) {
        const std::uint32_t pair = value % 100;
        byte = static_cast<std::uint8_t>(((pair / 10) << 4) | (pair % 10));
        value /= 100;
    }
    return out;
}

std::string formatVersion(std::uint32_t decimalVersion) {
    return std::format("{}.{:02}", decimalVersion / 100, decimalVersion % 100);
}

}  // namespace vgmtool::vgm
