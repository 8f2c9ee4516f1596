#pragma once

#include "vgmtool/vgm/Gd3Metadata.hpp"
#include "vgmtool/vgm/ParserConfig.hpp"
#include "vgmtool/vgm/VgmCommand.hpp"
#include "vgmtool/vgm/VgmError.hpp"
#include "vgmtool/vgm/VgmHeader.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vgmtool::vgm {

/// Header offset of the gd3_offset field; the tag lives at gd3Offset + this.
constexpr std::uint32_t kGd3OffsetBase = 0x14;
/// Header offset of the end-of-file field; eofOffset is relative to it.
constexpr std::uint32_t kEofOffsetBase = 0x04;
/// Header offset of the loop offset field.
constexpr std::uint32_t kLoopOffsetBase = 0x1C;

struct VgmFile {
    VgmHeader header;
    std::vector<VgmCommand> commands;
    std::optional<Gd3Metadata> metadata;

    [[nodiscard]] bool hasDataBlock() const;
    [[nodiscard]] bool hasPcmRamWrite() const;
    /// Sum of every wait, including the 0x7n and 0x8n forms.
    [[nodiscard]] std::uint64_t totalWaitSamples() const;

    bool operator==(const VgmFile&) const = default;
};

VgmResult<VgmFile> decodeFile(std::span<const std::uint8_t> bytes, const ParserConfig& config,
                              ResourceTracker& tracker);
VgmResult<VgmFile> decodeFile(std::span<const std::uint8_t> bytes, const ParserConfig& config = ParserConfig{});

/// Serializes header, commands and metadata, then rewrites gd3Offset and
/// eofOffset in the output so they describe the bytes actually written.
VgmResult<std::vector<std::uint8_t>> encodeFile(const VgmFile& file);

}  // namespace vgmtool::vgm
