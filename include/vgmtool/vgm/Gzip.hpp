#pragma once

#include "vgmtool/vgm/VgmError.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace vgmtool::vgm {

constexpr std::size_t kDefaultMaxInflatedSize = 64 * 1024 * 1024;

bool isVgmData(std::span<const std::uint8_t> bytes);
bool isGzipData(std::span<const std::uint8_t> bytes);

/// Returns plain VGM bytes: unchanged when already VGM, inflated when gzip
/// wrapped. Inflated output larger than `maxInflatedSize` is rejected.
VgmResult<std::vector<std::uint8_t>> detectAndDecompress(std::span<const std::uint8_t> bytes,
                                                         std::size_t maxInflatedSize = kDefaultMaxInflatedSize);

/// Wraps `bytes` in a gzip (.vgz) envelope. `level` is a zlib level, -1 for default.
VgmResult<std::vector<std::uint8_t>> compressGzip(std::span<const std::uint8_t> bytes, int level = -1);

}  // namespace vgmtool::vgm
