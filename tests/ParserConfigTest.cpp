#include "vgmtool/vgm/ParserConfig.hpp"

#include <nlohmann/json.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

namespace vgmtool::vgm {
namespace {

using json = nlohmann::json;

}  // namespace

TEST(ParserConfigTest, PresetsOrderedByStrictness) {
    const auto security = ParserConfig::securityFocused();
    const auto defaults = ParserConfig::defaults();
    const auto permissive = ParserConfig::permissive();

    EXPECT_LT(security.maxCommands, defaults.maxCommands);
    EXPECT_LT(defaults.maxCommands, permissive.maxCommands);
    EXPECT_LT(security.maxDataBlockSize, defaults.maxDataBlockSize);
    EXPECT_LT(defaults.maxDataBlockSize, permissive.maxDataBlockSize);
    EXPECT_LT(security.maxParsingDepth, permissive.maxParsingDepth);
    EXPECT_TRUE(security.strictResourceLimits);
    EXPECT_FALSE(permissive.strictResourceLimits);
}

TEST(ParserConfigTest, PresetLookupByName) {
    EXPECT_EQ(parserConfigPreset("default"), ParserConfig::defaults());
    EXPECT_EQ(parserConfigPreset("security"), ParserConfig::securityFocused());
    EXPECT_EQ(parserConfigPreset("security_focused"), ParserConfig::securityFocused());
    EXPECT_EQ(parserConfigPreset("permissive"), ParserConfig::permissive());
    EXPECT_FALSE(parserConfigPreset("paranoid").has_value());
}

TEST(ParserConfigTest, LimitChecksAreInclusive) {
    ParserConfig config;
    config.maxCommands = 10;
    config.maxMetadataSize = 100;
    EXPECT_TRUE(config.checkCommandCount(10).has_value());
    EXPECT_FALSE(config.checkCommandCount(11).has_value());
    EXPECT_TRUE(config.checkMetadataSize(100).has_value());

    auto tooBig = config.checkMetadataSize(101);
    ASSERT_FALSE(tooBig.has_value());
    EXPECT_EQ(tooBig.error().kind, VgmErrorKind::DataSizeExceedsLimit);
    EXPECT_EQ(tooBig.error().actual, 101u);
    EXPECT_EQ(tooBig.error().limit, 100u);
}

TEST(ParserConfigTest, ChipEntryLimits) {
    ParserConfig config;
    config.maxChipClockEntries = 2;
    config.maxChipVolumeEntries = 3;
    EXPECT_TRUE(config.checkChipEntries(2, 3).has_value());
    auto clocks = config.checkChipEntries(3, 0);
    ASSERT_FALSE(clocks.has_value());
    EXPECT_EQ(clocks.error().field, "chip_clock_entries");
    auto volumes = config.checkChipEntries(0, 4);
    ASSERT_FALSE(volumes.has_value());
    EXPECT_EQ(volumes.error().field, "chip_volume_entries");
}

TEST(ParserConfigTest, TrackerChecksBeforeIncrementing) {
    ParserConfig config;
    config.maxCommands = 2;
    config.maxDataBlockSize = 100;
    config.maxTotalDataBlockMemory = 150;
    ResourceTracker tracker;

    EXPECT_TRUE(tracker.trackCommand(config).has_value());
    EXPECT_TRUE(tracker.trackCommand(config).has_value());
    EXPECT_FALSE(tracker.trackCommand(config).has_value());
    EXPECT_EQ(tracker.commandCount(), 2u);

    EXPECT_TRUE(tracker.trackDataBlock(config, 100).has_value());
    EXPECT_FALSE(tracker.trackDataBlock(config, 101).has_value());
    auto total = tracker.trackDataBlock(config, 60);
    ASSERT_FALSE(total.has_value());
    EXPECT_EQ(total.error().field, "total_data_block_memory");
    EXPECT_EQ(tracker.dataBlockMemory(), 100u);
    EXPECT_EQ(tracker.dataBlockCount(), 1u);

    EXPECT_TRUE(tracker.trackDataBlock(config, 50).has_value());
    EXPECT_EQ(tracker.dataBlockMemory(), 150u);
}

TEST(ParserConfigTest, StrictLimitsAlsoBoundCommandMemory) {
    ParserConfig config;
    config.strictResourceLimits = true;
    config.maxCommandMemory = 250;
    ResourceTracker tracker;
    EXPECT_TRUE(tracker.trackCommand(config).has_value());
    EXPECT_TRUE(tracker.trackCommand(config).has_value());
    auto third = tracker.trackCommand(config);
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error().field, "command_memory");
    EXPECT_EQ(tracker.commandCount(), 2u);
}

TEST(ParserConfigTest, ContextGuardRestoresDepth) {
    ParserConfig config;
    config.maxParsingDepth = 2;
    ResourceTracker tracker;
    {
        auto outer = ParsingContextGuard::enter(tracker, config, 0);
        ASSERT_TRUE(outer.has_value());
        {
            auto inner = ParsingContextGuard::enter(tracker, config, 4);
            ASSERT_TRUE(inner.has_value());
            EXPECT_EQ(tracker.parsingDepth(), 2u);

            auto tooDeep = ParsingContextGuard::enter(tracker, config, 8);
            ASSERT_FALSE(tooDeep.has_value());
            EXPECT_EQ(tooDeep.error().kind, VgmErrorKind::ParseStackOverflow);
            EXPECT_EQ(tooDeep.error().offset, 8u);
            EXPECT_EQ(tracker.parsingDepth(), 2u);
        }
        EXPECT_EQ(tracker.parsingDepth(), 1u);
    }
    EXPECT_EQ(tracker.parsingDepth(), 0u);
}

TEST(ParserConfigTest, UsageSummaryReportsMegabytes) {
    ParserConfig config;
    ResourceTracker tracker;
    ASSERT_TRUE(tracker.trackDataBlock(config, 1024 * 1024).has_value());
    ASSERT_TRUE(tracker.trackCommand(config).has_value());

    const auto summary = tracker.usageSummary();
    EXPECT_EQ(summary.commandCount, 1u);
    EXPECT_EQ(summary.dataBlockCount, 1u);
    EXPECT_DOUBLE_EQ(summary.dataBlockMemoryMb, 1.0);
    EXPECT_EQ(summary.toString(), "Commands: 1, Data blocks: 1 (1.00 MB), Max depth: 0");
}

TEST(ParserConfigTest, UsageSummaryKeepsDeepestLevel) {
    ParserConfig config;
    ResourceTracker tracker;
    {
        auto outer = ParsingContextGuard::enter(tracker, config, 0);
        ASSERT_TRUE(outer.has_value());
    }
    EXPECT_EQ(tracker.parsingDepth(), 0u);
    EXPECT_EQ(tracker.maxParsingDepth(), 1u);

    const auto summary = tracker.usageSummary();
    EXPECT_EQ(summary.parsingDepth, 0u);
    EXPECT_EQ(summary.maxParsingDepth, 1u);
    EXPECT_EQ(summary.toString(), "Commands: 0, Data blocks: 0 (0.00 MB), Max depth: 1");
}

TEST(ParserConfigTest, JsonPresetWithOverrides) {
    const json value = {{"preset", "security"}, {"max_commands", 42}, {"strict_resource_limits", false}};
    auto config = parserConfigFromJson(value);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->maxCommands, 42u);
    EXPECT_FALSE(config->strictResourceLimits);
    EXPECT_EQ(config->maxDataBlockSize, ParserConfig::securityFocused().maxDataBlockSize);
}

TEST(ParserConfigTest, JsonRejectsBadValues) {
    EXPECT_FALSE(parserConfigFromJson(json::array()).has_value());
    EXPECT_FALSE(parserConfigFromJson(json{{"preset", "unknown"}}).has_value());
    EXPECT_FALSE(parserConfigFromJson(json{{"max_commands", -1}}).has_value());
    EXPECT_FALSE(parserConfigFromJson(json{{"max_chip_clock_entries", 300}}).has_value());
    EXPECT_FALSE(parserConfigFromJson(json{{"strict_resource_limits", "yes"}}).has_value());
}

TEST(ParserConfigTest, JsonRoundTrip) {
    const auto original = ParserConfig::permissive();
    auto restored = parserConfigFromJson(parserConfigToJson(original));
    ASSERT_TRUE(restored.has_value());
    EXPECT_EQ(*restored, original);
}

TEST(ParserConfigTest, LoadsConfigFile) {
    const auto path = std::filesystem::temp_directory_path() / "vgmtool_parser_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"preset": "permissive", "max_parsing_depth": 4})";
    }
    auto config = loadParserConfigFile(path);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(config->maxParsingDepth, 4u);
    EXPECT_EQ(config->maxCommands, ParserConfig::permissive().maxCommands);
    std::filesystem::remove(path);

    auto missing = loadParserConfigFile(path);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().kind, VgmErrorKind::FileNotFound);
}

TEST(ParserConfigTest, MalformedConfigFileIsInvalidFormat) {
    const auto path = std::filesystem::temp_directory_path() / "vgmtool_parser_config_bad.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    auto config = loadParserConfigFile(path);
    ASSERT_FALSE(config.has_value());
    EXPECT_EQ(config.error().kind, VgmErrorKind::InvalidDataFormat);
    std::filesystem::remove(path);
}

}  // namespace vgmtool::vgm
