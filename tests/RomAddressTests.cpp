#include <gtest/gtest.h>

#include <array>
#include <vector>

#include "Discovery/RomAddress.hpp"

namespace {

using OWBus::ErrorCode;
using OWBus::Discovery::RomAddress;

// Family 0x28, serial 0x665544332211, CRC-8 0x56
constexpr std::array<uint8_t, 8> kThermometerRom = {0x28, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x56};

TEST(RomAddressTests, ParsesFieldsInWireOrder) {
    const auto address = RomAddress::Parse(kThermometerRom);
    ASSERT_TRUE(address.has_value());

    EXPECT_EQ(address->Family(), 0x28);
    EXPECT_EQ(address->Checksum(), 0x56);

    const std::array<uint8_t, 6> serial = {0x11, 0x22, 0x33, 0x44, 0x55, 0x66};
    EXPECT_EQ(address->Serial(), serial);
    EXPECT_EQ(address->Bytes(), kThermometerRom);
}

TEST(RomAddressTests, DisplayReversesSerial) {
    const auto address = RomAddress::Parse(kThermometerRom);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ToDisplay(), "56.665544332211.28");
}

TEST(RomAddressTests, DisplayIsLowercaseAndZeroPadded) {
    const std::array<uint8_t, 8> raw = {0x05, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x49};
    const auto address = RomAddress::Parse(raw);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ToDisplay(), "49.060504030201.05");

    const std::array<uint8_t, 8> counter = {0x1D, 0xA1, 0xB2, 0xC3, 0xD4, 0xE5, 0xF6, 0x71};
    EXPECT_EQ(RomAddress::Parse(counter)->ToDisplay(), "71.f6e5d4c3b2a1.1d");
}

TEST(RomAddressTests, RejectsWrongLength) {
    const std::vector<uint8_t> shortRom(kThermometerRom.begin(), kThermometerRom.begin() + 7);
    const auto tooShort = RomAddress::Parse(shortRom);
    ASSERT_FALSE(tooShort.has_value());
    EXPECT_EQ(tooShort.error().code, ErrorCode::MalformedAddress);

    std::vector<uint8_t> longRom(kThermometerRom.begin(), kThermometerRom.end());
    longRom.push_back(0x00);
    EXPECT_FALSE(RomAddress::Parse(longRom).has_value());

    EXPECT_FALSE(RomAddress::Parse({}).has_value());
}

TEST(RomAddressTests, PermissiveParseKeepsBadChecksum) {
    std::array<uint8_t, 8> raw = kThermometerRom;
    raw[7] = 0x00;

    const auto address = RomAddress::Parse(raw);
    ASSERT_TRUE(address.has_value());
    EXPECT_FALSE(address->HasValidChecksum());
    EXPECT_EQ(address->Checksum(), 0x00);
}

TEST(RomAddressTests, EnforcedParseRejectsBadChecksum) {
    std::array<uint8_t, 8> raw = kThermometerRom;
    raw[7] = 0x00;

    const auto address = RomAddress::Parse(raw, RomAddress::ChecksumPolicy::Enforce);
    ASSERT_FALSE(address.has_value());
    EXPECT_EQ(address.error().code, ErrorCode::MalformedAddress);

    EXPECT_TRUE(RomAddress::Parse(kThermometerRom, RomAddress::ChecksumPolicy::Enforce).has_value());
}

TEST(RomAddressTests, DisplayStringRoundTrip) {
    const auto address = RomAddress::FromDisplayString("56.665544332211.28");
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->Bytes(), kThermometerRom);
    EXPECT_TRUE(address->HasValidChecksum());

    const auto upper = RomAddress::FromDisplayString("71.F6E5D4C3B2A1.1D");
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(upper->ToDisplay(), "71.f6e5d4c3b2a1.1d");
}

TEST(RomAddressTests, DisplayStringRejectsMalformedText) {
    EXPECT_FALSE(RomAddress::FromDisplayString("").has_value());
    EXPECT_FALSE(RomAddress::FromDisplayString("56-665544332211.28").has_value());
    EXPECT_FALSE(RomAddress::FromDisplayString("56.665544332211-28").has_value());
    EXPECT_FALSE(RomAddress::FromDisplayString("zz.665544332211.28").has_value());
    EXPECT_FALSE(RomAddress::FromDisplayString("56.66554433221g.28").has_value());
    EXPECT_FALSE(RomAddress::FromDisplayString("56.6655443322.28").has_value());

    const auto result = RomAddress::FromDisplayString("56.665544332211.2");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MalformedAddress);
}

TEST(RomAddressTests, PacksLittleEndian) {
    const auto address = RomAddress::Parse(kThermometerRom);
    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(address->ToUInt64(), 0x5666554433221128ull);
}

TEST(RomAddressTests, EqualityComparesAllBytes) {
    std::array<uint8_t, 8> other = kThermometerRom;
    other[3] ^= 0x01;

    EXPECT_EQ(*RomAddress::Parse(kThermometerRom), *RomAddress::Parse(kThermometerRom));
    EXPECT_NE(*RomAddress::Parse(kThermometerRom), *RomAddress::Parse(other));
}

} // namespace
