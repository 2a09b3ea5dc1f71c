#include <gtest/gtest.h>

#include <array>

#include "Common/HexFormat.hpp"

namespace {

using namespace OWBus;

TEST(HexFormatTests, DumpSeparatesBytesWithSpaces) {
    const std::array<uint8_t, 4> data = {0x50, 0x05, 0x4B, 0xFF};
    EXPECT_EQ(Hex::Dump(data), "50 05 4b ff");
}

TEST(HexFormatTests, DumpMarksEmptyInput) {
    EXPECT_EQ(Hex::Dump({}), "<empty>");
}

TEST(HexFormatTests, PackIsContiguousLowercase) {
    const std::array<uint8_t, 3> data = {0xAB, 0x01, 0x00};
    EXPECT_EQ(Hex::Pack(data), "ab0100");
    EXPECT_EQ(Hex::Pack({}), "");
}

TEST(HexFormatTests, ParseByteAcceptsEitherCase) {
    EXPECT_EQ(Hex::ParseByte("a5"), 0xA5);
    EXPECT_EQ(Hex::ParseByte("A5"), 0xA5);
    EXPECT_EQ(Hex::ParseByte("0f"), 0x0F);
}

TEST(HexFormatTests, ParseByteRejectsBadInput) {
    EXPECT_FALSE(Hex::ParseByte("g0").has_value());
    EXPECT_FALSE(Hex::ParseByte("1").has_value());
    EXPECT_FALSE(Hex::ParseByte("123").has_value());
    EXPECT_FALSE(Hex::ParseByte(" 1").has_value());
}

} // namespace
