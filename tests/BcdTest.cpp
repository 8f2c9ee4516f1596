#include "vgmtool/vgm/Bcd.hpp"

#include <gtest/gtest.h>

#include <array>
#include <cstdint>

namespace vgmtool::vgm {

TEST(BcdTest, DecodesLittleEndianVersionBytes) {
    const std::array<std::uint8_t, 4> v151{0x51, 0x01, 0x00, 0x00};
    auto decoded = bcdFromBytes(v151);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, 151u);

    const std::array<std::uint8_t, 4> v171{0x71, 0x01, 0x00, 0x00};
    decoded = bcdFromBytes(v171);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, 171u);
}

TEST(BcdTest, EmptyInputIsZero) {
    auto decoded = bcdFromBytes({});
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, 0u);
}

TEST(BcdTest, RejectsNibblesAboveNine) {
    const std::array<std::uint8_t, 4> bad{0x1A, 0x01, 0x00, 0x00};
    auto decoded = bcdFromBytes(bad);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, VgmErrorKind::InvalidBcdData);

    const std::array<std::uint8_t, 1> highNibble{0xF0};
    EXPECT_FALSE(bcdFromBytes(highNibble).has_value());
}

TEST(BcdTest, RejectsMoreThanFourBytes) {
    const std::array<std::uint8_t, 5> tooLong{0x01, 0x00, 0x00, 0x00, 0x00};
    auto decoded = bcdFromBytes(tooLong);
    ASSERT_FALSE(decoded.has_value());
    EXPECT_EQ(decoded.error().kind, VgmErrorKind::InvalidBcdData);
}

TEST(BcdTest, EncodesVersionAsFourBytes) {
    auto encoded = decimalToBcd(151);
    ASSERT_TRUE(encoded.has_value());
    const std::array<std::uint8_t, 4> expected{0x51, 0x01, 0x00, 0x00};
    EXPECT_EQ(*encoded, expected);
}

TEST(BcdTest, RoundTripsRepresentativeValues) {
    for (const std::uint32_t value : {0u, 1u, 9u, 10u, 51u, 99u, 100u, 151u, 171u, 9999u}) {
        auto encoded = decimalToBcd(value);
        ASSERT_TRUE(encoded.has_value()) << value;
        auto decoded = bcdFromBytes(*encoded);
        ASSERT_TRUE(decoded.has_value()) << value;
        EXPECT_EQ(*decoded, value);
    }
}

TEST(BcdTest, RejectsValuesBeyondEightDigits) {
    auto encoded = decimalToBcd(100'000'000);
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().kind, VgmErrorKind::IntegerOverflow);

    EXPECT_TRUE(decimalToBcd(99'999'999).has_value());
}

TEST(BcdTest, FormatsVersionWithTwoMinorDigits) {
    EXPECT_EQ(formatVersion(151), "1.51");
    EXPECT_EQ(formatVersion(101), "1.01");
    EXPECT_EQ(formatVersion(170), "1.70");
}

}  // namespace vgmtool::vgm
