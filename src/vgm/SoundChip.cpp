#include "vgmtool/vgm/SoundChip.hpp"

#include <array>

namespace vgmtool::vgm {
namespace {

struct SoundChipInfo {
    SoundChip chip;
    std::string_view name;
    std::uint32_t VgmHeader::*clock;
};

// Indexed by chip ID.
constexpr std::array<SoundChipInfo, kSoundChipCount> kSoundChips{{
    {SoundChip::SN76489, "SN76489", &VgmHeader::sn76489Clock},
    {SoundChip::YM2413, "YM2413", &VgmHeader::ym2413Clock},
    {SoundChip::YM2612, "YM2612", &VgmHeader::ym2612Clock},
    {SoundChip::YM2151, "YM2151", &VgmHeader::ym2151Clock},
    {SoundChip::SegaPCM, "SegaPCM", &VgmHeader::segaPcmClock},
    {SoundChip::RF5C68, "RF5C68", &VgmHeader::rf5c68Clock},
    {SoundChip::YM2203, "YM2203", &VgmHeader::ym2203Clock},
    {SoundChip::YM2608, "YM2608", &VgmHeader::ym2608Clock},
    {SoundChip::YM2610, "YM2610", &VgmHeader::ym2610Clock},
    {SoundChip::YM3812, "YM3812", &VgmHeader::ym3812Clock},
    {SoundChip::YM3526, "YM3526", &VgmHeader::ym3526Clock},
    {SoundChip::Y8950, "Y8950", &VgmHeader::y8950Clock},
    {SoundChip::YMF262, "YMF262", &VgmHeader::ymf262Clock},
    {SoundChip::YMF278B, "YMF278B", &VgmHeader::ymf278bClock},
    {SoundChip::YMF271, "YMF271", &VgmHeader::ymf271Clock},
    {SoundChip::YMZ280B, "YMZ280B", &VgmHeader::ymz280bClock},
    {SoundChip::RF5C164, "RF5C164", &VgmHeader::rf5c164Clock},
    {SoundChip::PWM, "PWM", &VgmHeader::pwmClock},
    {SoundChip::AY8910, "AY8910", &VgmHeader::ay8910Clock},
    {SoundChip::GameBoyDMG, "GameBoyDMG", &VgmHeader::gameBoyDmgClock},
    {SoundChip::NESAPU, "NESAPU", &VgmHeader::nesApuClock},
    {SoundChip::MultiPCM, "MultiPCM", &VgmHeader::multiPcmClock},
    {SoundChip::UPD7759, "UPD7759", &VgmHeader::upd7759Clock},
    {SoundChip::OKIM6258, "OKIM6258", &VgmHeader::okim6258Clock},
    {SoundChip::OKIM6295, "OKIM6295", &VgmHeader::okim6295Clock},
    {SoundChip::K051649, "K051649", &VgmHeader::k051649Clock},
    {SoundChip::K054539, "K054539", &VgmHeader::k054539Clock},
    {SoundChip::HuC6280, "HuC6280", &VgmHeader::huc6280Clock},
    {SoundChip::C140, "C140", &VgmHeader::c140Clock},
    {SoundChip::K053260, "K053260", &VgmHeader::k053260Clock},
    {SoundChip::Pokey, "Pokey", &VgmHeader::pokeyClock},
    {SoundChip::QSound, "QSound", &VgmHeader::qsoundClock},
    {SoundChip::SCSP, "SCSP", &VgmHeader::scspClock},
    {SoundChip::WonderSwan, "WonderSwan", &VgmHeader::wonderSwanClock},
    {SoundChip::VSU, "VSU", &VgmHeader::vsuClock},
    {SoundChip::SAA1099, "SAA1099", &VgmHeader::saa1099Clock},
    {SoundChip::ES5503, "ES5503", &VgmHeader::es5503Clock},
    {SoundChip::ES5506, "ES5506", &VgmHeader::es5506Clock},
    {SoundChip::X1010, "X1-010", &VgmHeader::x1010Clock},
    {SoundChip::C352, "C352", &VgmHeader::c352Clock},
    {SoundChip::GA20, "GA20", &VgmHeader::ga20Clock},
}};

const SoundChipInfo& info(SoundChip chip) {
    return kSoundChips[static_cast<std::size_t>(chip)];
}

}  // namespace

std::string_view soundChipName(SoundChip chip) {
    return info(chip).name;
}

std::optional<SoundChip> soundChipFromId(std::uint8_t chipId) {
    if (chipId >= kSoundChips.size()) {
        return std::nullopt;
    }
    return static_cast<SoundChip>(chipId);
}

std::uint32_t soundChipClock(const VgmHeader& header, SoundChip chip) {
    return header.*info(chip).clock;
}

std::vector<SoundChip> activeSoundChips(const VgmHeader& header) {
    std::vector<SoundChip> chips;
    for (const auto& entry : kSoundChips) {
        if ((header.*entry.clock & kChipClockMask) != 0) {
            chips.push_back(entry.chip);
        }
    }
    return chips;
}

}  // namespace vgmtool::vgm
