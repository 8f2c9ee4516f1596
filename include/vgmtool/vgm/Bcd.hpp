#pragma once

#include "vgmtool/vgm/VgmError.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string>

namespace vgmtool::vgm {

/// Decodes little-endian packed BCD (e.g. 51 01 00 00 -> 151).
VgmResult<std::uint32_t> bcdFromBytes(std::span<const std::uint8_t> bytes);

/// Encodes a decimal value as exactly four little-endian BCD bytes.
VgmResult<std::array<std::uint8_t, 4>> decimalToBcd(std::uint32_t value);

/// 151 -> "1.51"
std::string formatVersion(std::uint32_t decimalVersion);

}  // namespace vgmtool::vgm
