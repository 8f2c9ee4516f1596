#include "vgmtool/vgm/VgmFileIo.hpp"

#include "VgmTestHelpers.hpp"
#include "vgmtool/vgm/Gzip.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

namespace vgmtool::vgm {
namespace {

std::filesystem::path tempPath(const std::string& name) {
    return std::filesystem::temp_directory_path() / ("vgmtool_io_" + name);
}

VgmFile makeTaggedFile() {
    VgmFile file = test_helpers::makePsgFile();
    file.metadata = test_helpers::makeMetadata();
    return file;
}

}  // namespace

TEST(VgmFileIoTest, SaveThenLoadPlainFile) {
    const auto path = tempPath("plain.vgm");
    const VgmFile file = makeTaggedFile();
    ASSERT_TRUE(saveVgmFile(path, file).has_value());

    auto raw = readFileBytes(path);
    ASSERT_TRUE(raw.has_value());
    EXPECT_FALSE(isGzipData(*raw));

    auto loaded = loadVgm(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_FALSE(loaded->wasCompressed);
    EXPECT_EQ(loaded->byteSize, raw->size());
    EXPECT_EQ(loaded->file.commands, file.commands);
    EXPECT_EQ(loaded->file.metadata, file.metadata);
    EXPECT_EQ(loaded->usage.commandCount, file.commands.size());

    std::filesystem::remove(path);
}

TEST(VgmFileIoTest, SaveThenLoadCompressedFile) {
    const auto path = tempPath("packed.vgz");
    const VgmFile file = makeTaggedFile();
    ASSERT_TRUE(saveVgmFile(path, file, true).has_value());

    auto raw = readFileBytes(path);
    ASSERT_TRUE(raw.has_value());
    EXPECT_TRUE(isGzipData(*raw));

    auto loaded = loadVgm(path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->wasCompressed);
    EXPECT_EQ(loaded->file.commands, file.commands);

    auto plain = loadVgmFile(path);
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain->metadata, file.metadata);

    std::filesystem::remove(path);
}

TEST(VgmFileIoTest, MissingFile) {
    auto loaded = loadVgmFile(tempPath("does_not_exist.vgm"));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, VgmErrorKind::FileNotFound);
}

TEST(VgmFileIoTest, ShortFileIsRejected) {
    const auto path = tempPath("short.vgm");
    const std::vector<std::uint8_t> bytes{'V', 'g', 'm', ' ', 0x00, 0x00};
    ASSERT_TRUE(writeFileBytes(path, bytes).has_value());

    auto loaded = loadVgmFile(path);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, VgmErrorKind::FileTooSmall);

    std::filesystem::remove(path);
}

TEST(VgmFileIoTest, ValidationCanBeSkipped) {
    const auto path = tempPath("loud.vgm");
    VgmFile file = test_helpers::makePsgFile();
    // Data offset 0x4C keeps the header through 0x80, volume modifier included.
    file.header.vgmDataOffset = 0x4C;
    file.header.volumeModifier = 100;
    ASSERT_TRUE(saveVgmFile(path, file).has_value());

    auto validated = loadVgm(path);
    ASSERT_FALSE(validated.has_value());
    EXPECT_EQ(validated.error().kind, VgmErrorKind::ValidationFailed);

    auto unvalidated = loadVgm(path, ParserConfig{}, ValidationConfig{}, false);
    ASSERT_TRUE(unvalidated.has_value());
    EXPECT_EQ(unvalidated->file.header.volumeModifier, 100);

    std::filesystem::remove(path);
}

TEST(VgmFileIoTest, ParserLimitsApplyOnLoad) {
    const auto path = tempPath("limited.vgm");
    ASSERT_TRUE(saveVgmFile(path, test_helpers::makePsgFile()).has_value());

    ParserConfig config;
    config.maxCommands = 2;
    auto loaded = loadVgmFile(path, config);
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().kind, VgmErrorKind::DataSizeExceedsLimit);

    std::filesystem::remove(path);
}

}  // namespace vgmtool::vgm
