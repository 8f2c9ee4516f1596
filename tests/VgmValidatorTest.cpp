#include "vgmtool/vgm/VgmValidator.hpp"

#include "VgmTestHelpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace vgmtool::vgm {
namespace {

// The PSG fixture as it looks after a save and reload, with consistent offsets.
struct EncodedFile {
    VgmFile file;
    std::size_t size = 0;
};

EncodedFile encodedPsgFile() {
    auto bytes = encodeFile(test_helpers::makePsgFile());
    EncodedFile out;
    if (!bytes) {
        ADD_FAILURE() << bytes.error().message();
        return out;
    }
    auto file = decodeFile(*bytes);
    if (!file) {
        ADD_FAILURE() << file.error().message();
        return out;
    }
    out.file = std::move(*file);
    out.size = bytes->size();
    return out;
}

}  // namespace

TEST(VgmValidatorTest, AcceptsWellFormedFile) {
    const auto encoded = encodedPsgFile();
    EXPECT_TRUE(VgmValidator{}.validateFile(encoded.file, encoded.size).has_value());

    ValidationConfig strict;
    strict.strictMode = true;
    EXPECT_TRUE(VgmValidator{strict}.validateFile(encoded.file, encoded.size).has_value());
}

TEST(VgmValidatorTest, VersionRange) {
    VgmValidator validator;
    VgmHeader header = test_helpers::makePsgHeader();

    header.version = 0x00000100;
    EXPECT_TRUE(validator.validateVersion(header).has_value());
    header.version = 0x00000171;
    EXPECT_TRUE(validator.validateVersion(header).has_value());

    header.version = 0x00000172;
    auto tooNew = validator.validateVersion(header);
    ASSERT_FALSE(tooNew.has_value());
    EXPECT_EQ(tooNew.error().kind, VgmErrorKind::UnsupportedVgmVersion);
    EXPECT_EQ(tooNew.error().actual, 172u);
    EXPECT_EQ(tooNew.error().detail, "1.00-1.71");

    header.version = 0x00000099;
    EXPECT_FALSE(validator.validateVersion(header).has_value());

    header.version = 0x0000015F;
    auto notBcd = validator.validateVersion(header);
    ASSERT_FALSE(notBcd.has_value());
    EXPECT_EQ(notBcd.error().kind, VgmErrorKind::InvalidBcdData);
}

TEST(VgmValidatorTest, ConfiguredVersionWindow) {
    ValidationConfig config;
    config.minVgmVersion = 150;
    config.maxVgmVersion = 151;
    VgmValidator validator(config);
    VgmHeader header = test_helpers::makePsgHeader();

    EXPECT_TRUE(validator.validateVersion(header).has_value());
    header.version = 0x00000110;
    auto old = validator.validateVersion(header);
    ASSERT_FALSE(old.has_value());
    EXPECT_EQ(old.error().detail, "1.50-1.51");
}

TEST(VgmValidatorTest, ChipClockRanges) {
    VgmHeader header = test_helpers::makePsgHeader();
    EXPECT_TRUE(VgmValidator::validateChipClocks(header).has_value());

    header.ym2612Clock = 7'670'453;
    header.ym2151Clock = 3'579'545;
    EXPECT_TRUE(VgmValidator::validateChipClocks(header).has_value());

    header.ym2612Clock = 5'000'000;
    auto slow = VgmValidator::validateChipClocks(header);
    ASSERT_FALSE(slow.has_value());
    EXPECT_EQ(slow.error().kind, VgmErrorKind::ValidationFailed);
    EXPECT_EQ(slow.error().field, "YM2612 clock");

    header.ym2612Clock = 0;
    header.sn76489Clock = 9'000'000;
    auto fast = VgmValidator::validateChipClocks(header);
    ASSERT_FALSE(fast.has_value());
    EXPECT_EQ(fast.error().field, "SN76489 clock");
}

TEST(VgmValidatorTest, ClockFlagBitsAreIgnored) {
    VgmHeader header = test_helpers::makePsgHeader();
    // Dual-chip bit on an otherwise valid clock.
    header.sn76489Clock = 0x40000000u | 3'579'545u;
    EXPECT_TRUE(VgmValidator::validateChipClocks(header).has_value());

    header.sn76489Clock = 0xC0000000u;
    EXPECT_TRUE(VgmValidator::validateChipClocks(header).has_value());
}

TEST(VgmValidatorTest, VolumeModifierLimit) {
    VgmHeader header = test_helpers::makePsgHeader();
    header.volumeModifier = 64;
    EXPECT_TRUE(VgmValidator::validateChipVolumes(header).has_value());

    header.volumeModifier = 65;
    auto loud = VgmValidator::validateChipVolumes(header);
    ASSERT_FALSE(loud.has_value());
    EXPECT_EQ(loud.error().kind, VgmErrorKind::ValidationFailed);
    EXPECT_EQ(loud.error().field, "volume_modifier");
}

TEST(VgmValidatorTest, HeaderOffsetsMustPointInsideFile) {
    VgmHeader header = test_helpers::makePsgHeader();
    EXPECT_TRUE(VgmValidator::validateHeaderOffsets(header, 0x100).has_value());

    header.gd3Offset = 0x100 - kGd3OffsetBase - 1;
    EXPECT_TRUE(VgmValidator::validateHeaderOffsets(header, 0x100).has_value());

    header.gd3Offset = 0x100 - kGd3OffsetBase;
    auto gd3 = VgmValidator::validateHeaderOffsets(header, 0x100);
    ASSERT_FALSE(gd3.has_value());
    EXPECT_EQ(gd3.error().kind, VgmErrorKind::InvalidOffset);
    EXPECT_EQ(gd3.error().field, "gd3_offset");

    header.gd3Offset = 0;
    header.loopOffset = 0x200;
    auto loop = VgmValidator::validateHeaderOffsets(header, 0x100);
    ASSERT_FALSE(loop.has_value());
    EXPECT_EQ(loop.error().field, "loop_offset");
}

TEST(VgmValidatorTest, CommandAndBlockLimits) {
    ValidationConfig config;
    config.maxCommands = 3;
    config.maxDataBlockSize = 2;
    VgmValidator validator(config);

    std::vector<VgmCommand> commands{Wait735Samples{}, Wait735Samples{}, EndOfSoundData{}};
    EXPECT_TRUE(validator.validateCommands(commands).has_value());

    commands.insert(commands.begin(), Wait882Samples{});
    auto tooMany = validator.validateCommands(commands);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().kind, VgmErrorKind::DataSizeExceedsLimit);
    EXPECT_EQ(tooMany.error().field, "commands");

    const std::vector<VgmCommand> blocks{
        DataBlock{0x00, UncompressedStream{{StreamChip::YM2612, 0}, {0x80, 0x81, 0x82}}},
    };
    auto bigBlock = validator.validateCommands(blocks);
    ASSERT_FALSE(bigBlock.has_value());
    EXPECT_EQ(bigBlock.error().field, "data_block_size");
    EXPECT_EQ(bigBlock.error().actual, 3u);
}

TEST(VgmValidatorTest, ChipUsageNeedsConfiguredClock) {
    VgmHeader header = test_helpers::makePsgHeader();
    const std::vector<VgmCommand> fm{YM2612Port0Write{0x28, 0xF0, 0}, EndOfSoundData{}};

    auto missing = VgmValidator::validateChipUsage(header, fm);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, VgmErrorKind::InconsistentData);
    EXPECT_EQ(missing.error().field, "Chip usage validation");

    header.ym2612Clock = 7'670'453;
    EXPECT_TRUE(VgmValidator::validateChipUsage(header, fm).has_value());

    const std::vector<VgmCommand> waits{Wait735Samples{}, EndOfSoundData{}};
    EXPECT_TRUE(VgmValidator::validateChipUsage(VgmHeader{}, waits).has_value());
}

TEST(VgmValidatorTest, StrictModeChecksTerminationAndSize) {
    ValidationConfig config;
    config.strictMode = true;
    VgmValidator validator(config);

    auto encoded = encodedPsgFile();
    auto wrongSize = validator.validateFile(encoded.file, encoded.size + 2);
    ASSERT_FALSE(wrongSize.has_value());
    EXPECT_EQ(wrongSize.error().kind, VgmErrorKind::InconsistentData);
    EXPECT_EQ(wrongSize.error().field, "eof_offset");

    encoded.file.commands.pop_back();
    auto unterminated = validator.validateFile(encoded.file, encoded.size);
    ASSERT_FALSE(unterminated.has_value());
    EXPECT_EQ(unterminated.error().field, "Command stream");

    // Lenient mode accepts both.
    EXPECT_TRUE(VgmValidator{}.validateFile(encoded.file, encoded.size + 2).has_value());
}

TEST(VgmValidatorTest, FileSizeLimit) {
    ValidationConfig config;
    config.maxFileSize = 0x40;
    const auto encoded = encodedPsgFile();
    auto big = VgmValidator{config}.validateFile(encoded.file, encoded.size);
    ASSERT_FALSE(big.has_value());
    EXPECT_EQ(big.error().kind, VgmErrorKind::DataSizeExceedsLimit);
    EXPECT_EQ(big.error().field, "file_size");
}

TEST(VgmValidatorTest, QuickHeaderCheckSkipsCommands) {
    VgmValidator validator;
    VgmHeader header = test_helpers::makePsgHeader();
    EXPECT_TRUE(validator.quickValidateHeader(header).has_value());

    header.volumeModifier = 200;
    EXPECT_FALSE(validator.quickValidateHeader(header).has_value());
}

}  // namespace vgmtool::vgm
