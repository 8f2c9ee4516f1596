#pragma once

#include "vgmtool/vgm/DataBlock.hpp"
#include "vgmtool/vgm/VgmError.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vgmtool::vgm {

/// Expands `bitsCompressed`-wide symbols into little-endian values of
/// ceil(bitsDecompressed / 8) bytes until `uncompressedSize` bytes exist.
VgmResult<std::vector<std::uint8_t>> decompressBitPacking(std::span<const std::uint8_t> compressed,
                                                          const BitPackingParams& params,
                                                          std::uint32_t uncompressedSize,
                                                          std::optional<std::span<const std::uint8_t>> table);

/// Symbols index signed deltas in `table`; output is the running state.
VgmResult<std::vector<std::uint8_t>> decompressDpcm(std::span<const std::uint8_t> compressed, const DpcmParams& params,
                                                    std::uint32_t uncompressedSize,
                                                    std::optional<std::span<const std::uint8_t>> table);

}  // namespace vgmtool::vgm
