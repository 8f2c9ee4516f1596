#pragma once

#include "vgmtool/vgm/VgmError.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vgmtool::vgm {

/// UTF-16LE bytes (no terminator) to UTF-8. `field` names the string in errors.
VgmResult<std::string> decodeUtf16Le(std::span<const std::uint8_t> bytes, std::string_view field);

/// UTF-8 to UTF-16LE bytes, without a terminator.
VgmResult<std::vector<std::uint8_t>> encodeUtf16Le(std::string_view utf8, std::string_view field);

}  // namespace vgmtool::vgm
