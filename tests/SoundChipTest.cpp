#include "vgmtool/vgm/SoundChip.hpp"

#include "VgmTestHelpers.hpp"

#include <gtest/gtest.h>

#include <vector>

namespace vgmtool::vgm {

TEST(SoundChipTest, IdsFollowExtraHeaderNumbering) {
    EXPECT_EQ(soundChipFromId(0x00), SoundChip::SN76489);
    EXPECT_EQ(soundChipFromId(0x02), SoundChip::YM2612);
    EXPECT_EQ(soundChipFromId(0x1F), SoundChip::QSound);
    EXPECT_EQ(soundChipFromId(0x28), SoundChip::GA20);
    EXPECT_FALSE(soundChipFromId(0x29).has_value());
    EXPECT_FALSE(soundChipFromId(0xFF).has_value());

    EXPECT_EQ(soundChipName(SoundChip::YM2612), "YM2612");
    EXPECT_EQ(soundChipName(SoundChip::X1010), "X1-010");
}

TEST(SoundChipTest, ClockReadsMatchingHeaderField) {
    VgmHeader header;
    header.ym2151Clock = 3'579'545;
    header.okim6295Clock = 0x80000000u | 1'000'000u;
    header.ga20Clock = 3'579'545;

    EXPECT_EQ(soundChipClock(header, SoundChip::YM2151), 3'579'545u);
    EXPECT_EQ(soundChipClock(header, SoundChip::OKIM6295), 0x80000000u | 1'000'000u);
    EXPECT_EQ(soundChipClock(header, SoundChip::GA20), 3'579'545u);
    EXPECT_EQ(soundChipClock(header, SoundChip::YM2612), 0u);
}

TEST(SoundChipTest, ActiveChipsIgnoreFlagOnlyClocks) {
    VgmHeader header = test_helpers::makePsgHeader();
    header.ym2612Clock = 7'670'453;
    // Dual-chip flag with no frequency is not a configured chip.
    header.ym2413Clock = 0x40000000u;

    const std::vector<SoundChip> expected{SoundChip::SN76489, SoundChip::YM2612};
    EXPECT_EQ(activeSoundChips(header), expected);
    EXPECT_TRUE(activeSoundChips(VgmHeader{}).empty());
}

}  // namespace vgmtool::vgm
