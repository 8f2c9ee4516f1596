#pragma once

#include "vgmtool/vgm/ByteStream.hpp"
#include "vgmtool/vgm/ParserConfig.hpp"
#include "vgmtool/vgm/VgmError.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace vgmtool::vgm {

constexpr std::string_view kVgmMagic = "Vgm ";
/// Header-relative base of vgm_data_offset.
constexpr std::uint32_t kDataOffsetBase = 0x34;
/// Header-relative base of extra_header_offset.
constexpr std::uint32_t kExtraHeaderOffsetBase = 0xBC;
/// Command stream start for files that leave vgm_data_offset at zero (before 1.50).
constexpr std::uint32_t kLegacyDataStart = 0x40;
/// End of the newest known field layout (GA20 clock).
constexpr std::uint32_t kMaxFieldExtent = 0xE4;

struct ChipClockEntry {
    std::uint8_t chipId = 0;
    std::uint32_t clock = 0;

    bool operator==(const ChipClockEntry&) const = default;
};

struct ChipVolumeEntry {
    std::uint8_t chipId = 0;
    std::uint8_t flags = 0;
    std::uint16_t volume = 0;

    bool operator==(const ChipVolumeEntry&) const = default;
};

/// Sub-header at extra_header_offset + 0xBC. A zero section offset means the
/// section is absent; otherwise clocks live at +4+chipClockOffset and volumes
/// at +8+chipVolumeOffset, in whichever order those positions imply.
struct ExtraHeader {
    std::uint32_t headerSize = 12;
    std::uint32_t chipClockOffset = 0;
    std::uint32_t chipVolumeOffset = 0;
    std::vector<ChipClockEntry> chipClocks;
    std::vector<ChipVolumeEntry> chipVolumes;

    bool operator==(const ExtraHeader&) const = default;
};

struct VgmHeader {
    std::uint32_t eofOffset = 0;
    /// Raw BCD, e.g. 0x00000171 for 1.71.
    std::uint32_t version = 0x00000171;
    std::uint32_t sn76489Clock = 0;
    std::uint32_t ym2413Clock = 0;
    std::uint32_t gd3Offset = 0;
    std::uint32_t totalSamples = 0;
    std::uint32_t loopOffset = 0;
    std::uint32_t loopSamples = 0;
    std::uint32_t rate = 0;
    std::uint16_t sn76489Feedback = 0;
    std::uint8_t sn76489ShiftWidth = 0;
    std::uint8_t sn76489Flags = 0;
    std::uint32_t ym2612Clock = 0;
    std::uint32_t ym2151Clock = 0;
    std::uint32_t vgmDataOffset = 0x0C;

    // Present only when the data offset leaves room for them.
    std::uint32_t segaPcmClock = 0;
    std::uint32_t segaPcmInterfaceRegister = 0;
    std::uint32_t rf5c68Clock = 0;
    std::uint32_t ym2203Clock = 0;
    std::uint32_t ym2608Clock = 0;
    std::uint32_t ym2610Clock = 0;
    std::uint32_t ym3812Clock = 0;
    std::uint32_t ym3526Clock = 0;
    std::uint32_t y8950Clock = 0;
    std::uint32_t ymf262Clock = 0;
    std::uint32_t ymf278bClock = 0;
    std::uint32_t ymf271Clock = 0;
    std::uint32_t ymz280bClock = 0;
    std::uint32_t rf5c164Clock = 0;
    std::uint32_t pwmClock = 0;
    std::uint32_t ay8910Clock = 0;
    std::uint8_t ay8910ChipType = 0;
    std::uint8_t ay8910Flags = 0;
    std::uint8_t ym2203AyFlags = 0;
    std::uint8_t ym2608AyFlags = 0;
    std::uint8_t volumeModifier = 0;
    std::uint8_t reserved7D = 0;
    std::uint8_t loopBase = 0;
    std::uint8_t loopModifier = 0;
    std::uint32_t gameBoyDmgClock = 0;
    std::uint32_t nesApuClock = 0;
    std::uint32_t multiPcmClock = 0;
    std::uint32_t upd7759Clock = 0;
    std::uint32_t okim6258Clock = 0;
    std::uint8_t okim6258Flags = 0;
    std::uint8_t k054539Flags = 0;
    std::uint8_t c140ChipType = 0;
    std::uint8_t reserved97 = 0;
    std::uint32_t okim6295Clock = 0;
    std::uint32_t k051649Clock = 0;
    std::uint32_t k054539Clock = 0;
    std::uint32_t huc6280Clock = 0;
    std::uint32_t c140Clock = 0;
    std::uint32_t k053260Clock = 0;
    std::uint32_t pokeyClock = 0;
    std::uint32_t qsoundClock = 0;
    std::uint32_t scspClock = 0;
    std::uint32_t extraHeaderOffset = 0;
    std::uint32_t wonderSwanClock = 0;
    std::uint32_t vsuClock = 0;
    std::uint32_t saa1099Clock = 0;
    std::uint32_t es5503Clock = 0;
    std::uint32_t es5506Clock = 0;
    std::uint8_t es5503Channels = 0;
    std::uint8_t es5506Channels = 0;
    std::uint8_t c352ClockDivider = 0;
    std::uint8_t reservedD7 = 0;
    std::uint32_t x1010Clock = 0;
    std::uint32_t c352Clock = 0;
    std::uint32_t ga20Clock = 0;

    std::optional<ExtraHeader> extraHeader;

    bool operator==(const VgmHeader&) const = default;
};

/// Absolute command stream start (header-relative), validated to leave room
/// for the fixed prefix.
VgmResult<std::uint64_t> commandStreamStart(const VgmHeader& header);

/// Decodes the header at the reader position and leaves the reader at the
/// command stream start.
VgmResult<VgmHeader> decodeHeader(ByteReader& reader, const ParserConfig& config, ResourceTracker& tracker);
VgmResult<VgmHeader> decodeHeader(std::span<const std::uint8_t> bytes, const ParserConfig& config = ParserConfig{});

/// Writes exactly commandStreamStart(header) bytes.
VgmResult<void> encodeHeader(const VgmHeader& header, ByteWriter& writer);

struct HeaderFieldValue {
    std::string_view name;
    std::uint32_t offset = 0;
    std::uint8_t width = 0;
    std::uint32_t value = 0;
    /// False for fields past the command stream start (or the extra header).
    bool present = false;
};

/// Every known field after the magic, in layout order.
VgmResult<std::vector<HeaderFieldValue>> headerFields(const VgmHeader& header);

/// Decimal form of the BCD version field (0x151 -> 151).
VgmResult<std::uint32_t> decimalVersion(const VgmHeader& header);

}  // namespace vgmtool::vgm
