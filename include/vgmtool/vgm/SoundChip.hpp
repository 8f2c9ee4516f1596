#pragma once

#include "vgmtool/vgm/VgmHeader.hpp"

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace vgmtool::vgm {

/// Sound chips a VGM header can clock. Values are the chip IDs used by the
/// extra header. Variants selected by clock bit 31 (YM2610B, K052539, ES5505)
/// share the entry of their base chip.
enum class SoundChip : std::uint8_t {
    SN76489 = 0x00,
    YM2413 = 0x01,
    YM2612 = 0x02,
    YM2151 = 0x03,
    SegaPCM = 0x04,
    RF5C68 = 0x05,
    YM2203 = 0x06,
    YM2608 = 0x07,
    YM2610 = 0x08,
    YM3812 = 0x09,
    YM3526 = 0x0A,
    Y8950 = 0x0B,
    YMF262 = 0x0C,
    YMF278B = 0x0D,
    YMF271 = 0x0E,
    YMZ280B = 0x0F,
    RF5C164 = 0x10,
    PWM = 0x11,
    AY8910 = 0x12,
    GameBoyDMG = 0x13,
    NESAPU = 0x14,
    MultiPCM = 0x15,
    UPD7759 = 0x16,
    OKIM6258 = 0x17,
    OKIM6295 = 0x18,
    K051649 = 0x19,
    K054539 = 0x1A,
    HuC6280 = 0x1B,
    C140 = 0x1C,
    K053260 = 0x1D,
    Pokey = 0x1E,
    QSound = 0x1F,
    SCSP = 0x20,
    WonderSwan = 0x21,
    VSU = 0x22,
    SAA1099 = 0x23,
    ES5503 = 0x24,
    ES5506 = 0x25,
    X1010 = 0x26,
    C352 = 0x27,
    GA20 = 0x28,
};

inline constexpr std::size_t kSoundChipCount = 0x29;

/// Bits 30 and 31 of a header clock are mode flags, not part of the frequency.
inline constexpr std::uint32_t kChipClockMask = 0x3FFFFFFF;

std::string_view soundChipName(SoundChip chip);

/// nullopt for IDs past the last known chip.
std::optional<SoundChip> soundChipFromId(std::uint8_t chipId);

/// The raw header clock field, flag bits included.
std::uint32_t soundChipClock(const VgmHeader& header, SoundChip chip);

/// Chips whose masked clock is non-zero, in chip ID order.
std::vector<SoundChip> activeSoundChips(const VgmHeader& header);

}  // namespace vgmtool::vgm
