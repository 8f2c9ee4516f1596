#include "vgmtool/vgm/Gd3Metadata.hpp"

#include "VgmTestHelpers.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace vgmtool::vgm {
namespace {

// Builds a GD3 tag from ASCII strings, each NUL terminated.
std::vector<std::uint8_t> buildTag(const std::vector<std::string_view>& strings) {
    std::vector<std::uint8_t> body;
    for (const auto text : strings) {
        for (const char c : text) {
            body.push_back(static_cast<std::uint8_t>(c));
            body.push_back(0);
        }
        body.push_back(0);
        body.push_back(0);
    }
    std::vector<std::uint8_t> tag;
    test_helpers::appendAscii(tag, kGd3Magic);
    tag.insert(tag.end(), kGd3Version.begin(), kGd3Version.end());
    test_helpers::writeU32(tag, tag.size(), static_cast<std::uint32_t>(body.size()));
    tag.insert(tag.end(), body.begin(), body.end());
    return tag;
}

}  // namespace

TEST(Gd3MetadataTest, DecodesInterleavedLocaleStrings) {
    const auto tag = buildTag({"Track", "TrackJ", "Game", "GameJ", "System", "SystemJ", "Author", "AuthorJ",
                               "2024/01/02", "Ripper", "Notes"});
    auto metadata = decodeGd3(tag);
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->english.track, "Track");
    EXPECT_EQ(metadata->japanese.track, "TrackJ");
    EXPECT_EQ(metadata->english.game, "Game");
    EXPECT_EQ(metadata->japanese.game, "GameJ");
    EXPECT_EQ(metadata->english.system, "System");
    EXPECT_EQ(metadata->japanese.system, "SystemJ");
    EXPECT_EQ(metadata->english.author, "Author");
    EXPECT_EQ(metadata->japanese.author, "AuthorJ");
    EXPECT_EQ(metadata->releaseDate, "2024/01/02");
    EXPECT_EQ(metadata->creator, "Ripper");
    EXPECT_EQ(metadata->notes, "Notes");
}

TEST(Gd3MetadataTest, EncodeThenDecodePreservesUnicode) {
    const auto metadata = test_helpers::makeMetadata();
    ByteWriter writer;
    ASSERT_TRUE(encodeGd3(metadata, writer).has_value());
    EXPECT_TRUE(hasGd3Magic(writer.bytes()));

    auto decoded = decodeGd3(writer.bytes());
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, metadata);
}

TEST(Gd3MetadataTest, EncodedLengthCoversBody) {
    ByteWriter writer;
    ASSERT_TRUE(encodeGd3(Gd3Metadata{}, writer).has_value());
    // Eleven empty strings are eleven UTF-16 terminators.
    ASSERT_EQ(writer.size(), 12u + 22u);
    EXPECT_EQ(test_helpers::readU32(writer.bytes(), 8), 22u);
}

TEST(Gd3MetadataTest, EncodeRejectsEmbeddedNul) {
    Gd3Metadata metadata;
    metadata.english.track = std::string("A\0B", 3);
    ByteWriter writer;
    auto encoded = encodeGd3(metadata, writer);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().kind, VgmErrorKind::InvalidUtf16Encoding);
    EXPECT_EQ(encoded.error().field, "English track");
    EXPECT_EQ(writer.size(), 0u);
}

TEST(Gd3MetadataTest, ExtraTrailingStringsAreIgnored) {
    auto tag = buildTag({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k", "extra"});
    auto metadata = decodeGd3(tag);
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->notes, "k");
}

TEST(Gd3MetadataTest, TooFewStringsIsInvalidLength) {
    auto tag = buildTag({"a", "b", "c"});
    auto metadata = decodeGd3(tag);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::InvalidDataLength);
    EXPECT_EQ(metadata.error().expected, kGd3StringCount);
    EXPECT_EQ(metadata.error().actual, 3u);
}

TEST(Gd3MetadataTest, RejectsWrongMagic) {
    auto tag = buildTag({});
    tag[0] = 'X';
    auto metadata = decodeGd3(tag);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::InvalidMagicBytes);
}

TEST(Gd3MetadataTest, RejectsUnknownVersion) {
    auto tag = buildTag({});
    tag[5] = 0x02;
    auto metadata = decodeGd3(tag);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::UnsupportedGd3Version);
    EXPECT_EQ(metadata.error().actual, 0x00000200u);
    EXPECT_TRUE(metadata.error().isRecoverable());
}

TEST(Gd3MetadataTest, RejectsOddLength) {
    auto tag = buildTag({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k"});
    test_helpers::writeU32(tag, 8, 3);
    auto metadata = decodeGd3(tag);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::InvalidDataFormat);
}

TEST(Gd3MetadataTest, LengthIsCheckedAgainstMetadataLimit) {
    auto tag = buildTag({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k"});
    ParserConfig config;
    config.maxMetadataSize = 8;
    auto metadata = decodeGd3(tag, config);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::DataSizeExceedsLimit);
    EXPECT_EQ(metadata.error().field, "metadata_size");
}

TEST(Gd3MetadataTest, LengthPastEndUnderflows) {
    auto tag = buildTag({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k"});
    tag.resize(tag.size() - 4);
    auto metadata = decodeGd3(tag);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::BufferUnderflow);
}

TEST(Gd3MetadataTest, InvalidUtf16IsReportedPerField) {
    auto tag = buildTag({"a", "b", "c", "d", "e", "f", "g", "h", "i", "j", "k"});
    // Replace the first track character with an unpaired low surrogate.
    tag[12] = 0x00;
    tag[13] = 0xDC;
    auto metadata = decodeGd3(tag);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().kind, VgmErrorKind::InvalidUtf16Encoding);
    EXPECT_EQ(metadata.error().field, "English track");
}

}  // namespace vgmtool::vgm
