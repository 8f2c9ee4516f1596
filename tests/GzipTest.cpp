#include "vgmtool/vgm/Gzip.hpp"

#include "VgmTestHelpers.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <vector>

namespace vgmtool::vgm {

TEST(GzipTest, DetectsMagic) {
    const std::array<std::uint8_t, 4> vgm{'V', 'g', 'm', ' '};
    const std::array<std::uint8_t, 2> gzip{0x1F, 0x8B};
    EXPECT_TRUE(isVgmData(vgm));
    EXPECT_FALSE(isGzipData(vgm));
    EXPECT_TRUE(isGzipData(gzip));
    EXPECT_FALSE(isVgmData(gzip));
    EXPECT_FALSE(isVgmData(std::span<const std::uint8_t>{}));
}

TEST(GzipTest, PlainVgmPassesThrough) {
    const std::array<std::uint8_t, 2> commands{0x62, 0x66};
    const auto bytes = test_helpers::buildVgmBytes(commands);
    auto result = detectAndDecompress(bytes);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, bytes);
}

TEST(GzipTest, CompressedVgmInflatesToOriginal) {
    const std::array<std::uint8_t, 2> commands{0x62, 0x66};
    const auto bytes = test_helpers::buildVgmBytes(commands);

    auto packed = compressGzip(bytes);
    ASSERT_TRUE(packed.has_value());
    EXPECT_TRUE(isGzipData(*packed));

    auto unpacked = detectAndDecompress(*packed);
    ASSERT_TRUE(unpacked.has_value());
    EXPECT_EQ(*unpacked, bytes);
}

TEST(GzipTest, InflatedSizeIsCapped) {
    std::vector<std::uint8_t> bytes(4096, 0);
    bytes[0] = 'V';
    bytes[1] = 'g';
    bytes[2] = 'm';
    bytes[3] = ' ';
    auto packed = compressGzip(bytes);
    ASSERT_TRUE(packed.has_value());

    auto unpacked = detectAndDecompress(*packed, 1024);
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().kind, VgmErrorKind::DataSizeExceedsLimit);
    EXPECT_EQ(unpacked.error().field, "decompressed_file_size");
}

TEST(GzipTest, InflatedNonVgmIsInvalidMagic) {
    const std::vector<std::uint8_t> text{'h', 'e', 'l', 'l', 'o', '!'};
    auto packed = compressGzip(text);
    ASSERT_TRUE(packed.has_value());

    auto unpacked = detectAndDecompress(*packed);
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().kind, VgmErrorKind::InvalidMagicBytes);
    EXPECT_EQ(unpacked.error().detail, "hell");
}

TEST(GzipTest, CorruptStreamIsInvalidFormat) {
    const std::array<std::uint8_t, 2> commands{0x62, 0x66};
    auto packed = compressGzip(test_helpers::buildVgmBytes(commands));
    ASSERT_TRUE(packed.has_value());
    packed->resize(packed->size() / 2);

    auto unpacked = detectAndDecompress(*packed);
    ASSERT_FALSE(unpacked.has_value());
    EXPECT_EQ(unpacked.error().kind, VgmErrorKind::InvalidDataFormat);
}

TEST(GzipTest, UnknownMagicIsRejected) {
    const std::array<std::uint8_t, 4> bytes{'R', 'I', 'F', 'F'};
    auto result = detectAndDecompress(bytes);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, VgmErrorKind::InvalidDataFormat);
}

}  // namespace vgmtool::vgm
