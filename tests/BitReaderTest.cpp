#include "vgmtool/vgm/BitReader.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>

namespace vgmtool::vgm {

TEST(BitReaderTest, ReadsMostSignificantBitFirst) {
    const std::array<std::uint8_t, 2> data{0xAA, 0xCC};
    BitReader reader(data);

    auto first = reader.readBits(4);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, 0x0A);
    EXPECT_EQ(reader.bitPosition(), 4);

    auto second = reader.readBits(4);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, 0x0A);
    EXPECT_EQ(reader.bytePosition(), 1u);
    EXPECT_EQ(reader.bitPosition(), 0);
}

TEST(BitReaderTest, FieldsCrossByteBoundaries) {
    const std::array<std::uint8_t, 2> data{0xAA, 0xCC};
    BitReader reader(data);

    auto head = reader.readBits(3);
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(*head, 0b101);

    auto spanning = reader.readBits(10);
    ASSERT_TRUE(spanning.has_value());
    // 0b01010 from the first byte, 0b11001 from the second.
    EXPECT_EQ(*spanning, 0b0101011001);
    EXPECT_EQ(reader.bitsRemaining(), 3u);
}

TEST(BitReaderTest, ReadsSixteenBitFields) {
    const std::array<std::uint8_t, 2> data{0x12, 0x34};
    BitReader reader(data);
    auto value = reader.readBits(16);
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 0x1234);
    EXPECT_EQ(reader.bitsRemaining(), 0u);
}

TEST(BitReaderTest, RejectsWidthsAboveSixteen) {
    const std::array<std::uint8_t, 4> data{};
    BitReader reader(data);
    auto tooWide = reader.readBits(17);
    ASSERT_FALSE(tooWide.has_value());
    EXPECT_EQ(tooWide.error().kind, VgmErrorKind::InvalidDataFormat);
    EXPECT_EQ(reader.bitsRemaining(), 32u);
}

TEST(BitReaderTest, ZeroWidthReadIsEmpty) {
    const std::array<std::uint8_t, 1> data{0xFF};
    BitReader reader(data);
    auto none = reader.readBits(0);
    ASSERT_TRUE(none.has_value());
    EXPECT_EQ(*none, 0);
    EXPECT_EQ(reader.bitsRemaining(), 8u);
}

TEST(BitReaderTest, ReportsUnderflowWithoutMoving) {
    const std::array<std::uint8_t, 1> data{0xFF};
    BitReader reader(data);
    ASSERT_TRUE(reader.readBits(6).has_value());

    auto tooMany = reader.readBits(3);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().kind, VgmErrorKind::BufferUnderflow);
    EXPECT_EQ(reader.bitsRemaining(), 2u);
}

}  // namespace vgmtool::vgm
