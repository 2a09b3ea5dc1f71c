#include <gtest/gtest.h>

#include <memory>

#include "Devices/AddressableSwitch.hpp"
#include "Devices/Counter.hpp"
#include "Devices/DeviceFamilies.hpp"
#include "Devices/SerialNumber.hpp"
#include "Devices/Thermometer.hpp"
#include "Discovery/BusDirectory.hpp"
#include "mocks/FakeOneWireBus.hpp"

namespace {

using namespace OWBus;
using Discovery::BusDirectory;
using Discovery::FamilyRegistry;
using Discovery::RomAddress;
using Fakes::FakeOneWireBus;

const FakeOneWireBus::Rom kThermRom  = FakeOneWireBus::MakeRom({0x28, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66});
const FakeOneWireBus::Rom kSwitchRom = FakeOneWireBus::MakeRom({0x05, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06});
const FakeOneWireBus::Rom kSerialRom = FakeOneWireBus::MakeRom({0x01, 0x10, 0x20, 0x30, 0x40, 0x50, 0x60});
const FakeOneWireBus::Rom kOtherRom  = FakeOneWireBus::MakeRom({0x42, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06});

constexpr std::array<uint8_t, 8> kPowerOnScratchpad = {0x50, 0x05, 0x4B, 0x46, 0x7F, 0xFF, 0x0C, 0x10};

class BusDirectoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        Devices::RegisterKnownFamilies(registry_);
        auto fake = std::make_unique<FakeOneWireBus>();
        fake_ = fake.get();
        pending_ = std::move(fake);
    }

    // Devices are added to the fake before the directory takes ownership of it.
    BusDirectory& Bus(BusConfig config = BusConfig::MakeDefault()) {
        if (!bus_) {
            bus_ = std::make_unique<BusDirectory>(std::move(pending_), config, registry_);
        }
        return *bus_;
    }

    FamilyRegistry registry_;
    FakeOneWireBus* fake_{nullptr};
    std::unique_ptr<FakeOneWireBus> pending_;
    std::unique_ptr<BusDirectory> bus_;
};

// ============================================================================
// Discovery
// ============================================================================

TEST_F(BusDirectoryTest, DiscoverBuildsTypedInitializedDevices) {
    fake_->AddThermometer(kThermRom, kPowerOnScratchpad);
    fake_->AddSwitch(kSwitchRom, false);

    auto devices = Bus().Discover();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 2u);

    auto* thermometer = dynamic_cast<Devices::Thermometer*>((*devices)[0].get());
    ASSERT_NE(thermometer, nullptr);
    EXPECT_EQ(thermometer->GetConversionState(), Devices::ConversionState::Ready);
    EXPECT_EQ(thermometer->AlarmHigh(), 75);
    EXPECT_EQ(thermometer->AlarmLow(), 70);
    EXPECT_EQ(thermometer->GetResolution(), Devices::Resolution::Bits12);
    EXPECT_DOUBLE_EQ(*thermometer->LastTemperature(), 85.0);

    auto* sw = dynamic_cast<Devices::AddressableSwitch*>((*devices)[1].get());
    ASSERT_NE(sw, nullptr);
    const auto on = sw->IsOn();
    ASSERT_TRUE(on.has_value());
    EXPECT_EQ(*on, fake_->SwitchIsOn(kSwitchRom));
}

TEST_F(BusDirectoryTest, DiscoverUsesGenericDeviceForUnknownFamily) {
    fake_->AddSearchResult(Bytes(kSerialRom.begin(), kSerialRom.end()));
    fake_->AddSearchResult(Bytes(kOtherRom.begin(), kOtherRom.end()));

    auto devices = Bus().Discover();
    ASSERT_TRUE(devices.has_value());
    ASSERT_EQ(devices->size(), 2u);

    EXPECT_NE(dynamic_cast<Devices::SerialNumber*>((*devices)[0].get()), nullptr);
    EXPECT_STREQ((*devices)[1]->GetName(), "OWDevice");
    EXPECT_EQ((*devices)[1]->GetFamily(), 0x42);

    // Neither family has discovery-time state.
    EXPECT_TRUE(fake_->Transactions().empty());
}

TEST_F(BusDirectoryTest, DiscoverOnEmptyBusYieldsNothing) {
    auto devices = Bus().Discover();
    ASSERT_TRUE(devices.has_value());
    EXPECT_TRUE(devices->empty());
    EXPECT_EQ(fake_->LastSearchCommand(), Wire::kSearchRom);
}

TEST_F(BusDirectoryTest, ConditionalSearchReturnsAlarmingDevicesOnly) {
    fake_->AddThermometer(kThermRom, kPowerOnScratchpad);
    fake_->AddSearchResult(Bytes(kSerialRom.begin(), kSerialRom.end()));
    fake_->AddAlarmResult(Bytes(kThermRom.begin(), kThermRom.end()));

    auto addresses = Bus().SearchAddresses(Wire::kCondSearchRom);
    ASSERT_TRUE(addresses.has_value());
    ASSERT_EQ(addresses->size(), 1u);
    EXPECT_EQ((*addresses)[0].Family(), Family::kThermometer);
    EXPECT_EQ(fake_->LastSearchCommand(), Wire::kCondSearchRom);
}

TEST_F(BusDirectoryTest, RejectsNonSearchCommand) {
    auto result = Bus().Discover(Wire::kSkipRom);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidArgument);
    EXPECT_FALSE(fake_->LastSearchCommand().has_value());
}

TEST_F(BusDirectoryTest, SkipsAddressWithBadChecksum) {
    FakeOneWireBus::Rom corrupt = kSerialRom;
    corrupt[7] ^= 0xFF;
    fake_->AddSearchResult(Bytes(corrupt.begin(), corrupt.end()));
    fake_->AddSearchResult(Bytes(kOtherRom.begin(), kOtherRom.end()));

    auto addresses = Bus().SearchAddresses();
    ASSERT_TRUE(addresses.has_value());
    ASSERT_EQ(addresses->size(), 1u);
    EXPECT_EQ((*addresses)[0].Family(), 0x42);
}

TEST_F(BusDirectoryTest, KeepsBadChecksumWhenVerificationDisabled) {
    FakeOneWireBus::Rom corrupt = kSerialRom;
    corrupt[7] ^= 0xFF;
    fake_->AddSearchResult(Bytes(corrupt.begin(), corrupt.end()));

    BusConfig config = BusConfig::MakeDefault();
    config.verifyRomChecksum = false;

    auto addresses = Bus(config).SearchAddresses();
    ASSERT_TRUE(addresses.has_value());
    ASSERT_EQ(addresses->size(), 1u);
    EXPECT_FALSE((*addresses)[0].HasValidChecksum());
}

TEST_F(BusDirectoryTest, SkipsWrongLengthAddressWithoutAbortingScan) {
    fake_->AddSearchResult(Bytes{0x28, 0x11, 0x22});
    fake_->AddSearchResult(Bytes(kOtherRom.begin(), kOtherRom.end()));

    BusConfig config = BusConfig::MakeDefault();
    config.verifyRomChecksum = false;

    auto addresses = Bus(config).SearchAddresses();
    ASSERT_TRUE(addresses.has_value());
    ASSERT_EQ(addresses->size(), 1u);
    EXPECT_EQ((*addresses)[0].Family(), 0x42);
}

TEST_F(BusDirectoryTest, SearchTransportFailureIsSurfaced) {
    fake_->AddSearchResult(Bytes(kSerialRom.begin(), kSerialRom.end()));
    fake_->AddSearchResult(Bytes(kOtherRom.begin(), kOtherRom.end()));
    fake_->FailSearchAfter(1);

    auto devices = Bus().Discover();
    ASSERT_FALSE(devices.has_value());
    EXPECT_EQ(devices.error().code, ErrorCode::Transport);
}

TEST_F(BusDirectoryTest, InitializationFailureIsSurfaced) {
    fake_->AddThermometer(kThermRom, kPowerOnScratchpad);
    fake_->SetReplyLimit(4);

    auto devices = Bus().Discover();
    ASSERT_FALSE(devices.has_value());
    EXPECT_EQ(devices.error().code, ErrorCode::Protocol);
}

// ============================================================================
// Attach
// ============================================================================

TEST_F(BusDirectoryTest, AttachUnselectedDoesNotTouchBus) {
    fake_->AddThermometer(kThermRom, kPowerOnScratchpad);

    auto device = Bus().Attach(*RomAddress::Parse(kThermRom));
    ASSERT_TRUE(device.has_value());
    EXPECT_TRUE(fake_->Transactions().empty());

    auto* thermometer = dynamic_cast<Devices::Thermometer*>(device->get());
    ASSERT_NE(thermometer, nullptr);
    EXPECT_FALSE(thermometer->AlarmHigh().has_value());
}

TEST_F(BusDirectoryTest, AttachSelectedInitializesState) {
    fake_->AddThermometer(kThermRom, kPowerOnScratchpad);

    auto device = Bus().Attach(*RomAddress::Parse(kThermRom), true);
    ASSERT_TRUE(device.has_value());
    ASSERT_EQ(fake_->Transactions().size(), 1u);

    auto* thermometer = dynamic_cast<Devices::Thermometer*>(device->get());
    ASSERT_NE(thermometer, nullptr);
    EXPECT_EQ(thermometer->AlarmHigh(), 75);
}

TEST_F(BusDirectoryTest, AttachHonoursCallerRegistry) {
    FamilyRegistry custom;
    custom.Register(Family::kThermometer, &Devices::MakeDevice<Devices::SerialNumber>);
    BusDirectory bus(std::move(pending_), BusConfig::MakeDefault(), custom);

    auto device = bus.Attach(*RomAddress::Parse(kThermRom), true);
    ASSERT_TRUE(device.has_value());
    EXPECT_NE(dynamic_cast<Devices::SerialNumber*>(device->get()), nullptr);
}

TEST_F(BusDirectoryTest, DefaultConstructorUsesSharedRegistry) {
    fake_->AddThermometer(kThermRom, kPowerOnScratchpad);
    BusDirectory bus(std::move(pending_));

    auto device = bus.Attach(*RomAddress::Parse(kThermRom));
    ASSERT_TRUE(device.has_value());
    EXPECT_STREQ((*device)->GetName(), "Thermometer");
}

// ============================================================================
// Broadcasts
// ============================================================================

TEST_F(BusDirectoryTest, SkipRomBroadcastFrame) {
    ASSERT_TRUE(Bus().SkipRomBroadcast().has_value());

    ASSERT_EQ(fake_->Transactions().size(), 1u);
    const auto& tx = fake_->Transactions()[0];
    EXPECT_EQ(tx.write, (Bytes{0xCC}));
    EXPECT_TRUE(tx.resetFirst);
    EXPECT_EQ(tx.readLength, 0u);
}

TEST_F(BusDirectoryTest, ConvertTBroadcastFrame) {
    ASSERT_TRUE(Bus().ConvertTBroadcast().has_value());

    ASSERT_EQ(fake_->Transactions().size(), 1u);
    const auto& tx = fake_->Transactions()[0];
    EXPECT_EQ(tx.write, (Bytes{0xCC, 0x44}));
    EXPECT_TRUE(tx.resetFirst);
    EXPECT_EQ(tx.readLength, 0u);
}

TEST_F(BusDirectoryTest, BroadcastFailureIsSurfaced) {
    fake_->FailTransactAfter(0);
    auto result = Bus().ConvertTBroadcast();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Transport);
}

TEST_F(BusDirectoryTest, ResetBusReportsMissingPresence) {
    EXPECT_TRUE(Bus().ResetBus().has_value());

    fake_->FailReset();
    auto result = Bus().ResetBus();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Transport);
    EXPECT_EQ(fake_->ResetCount(), 2u);
}

} // namespace
