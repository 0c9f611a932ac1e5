// BlueZ provider checks that need no system bus
#include <gtest/gtest.h>
#include <string>

#include "bridge/connections_bridge.hpp"
#include "events/event_cache.hpp"
#include "provider/bluez_dbus_util.hpp"
#include "provider/bluez_provider.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

using medium::Medium;
using medium::MediumSet;

namespace
{
struct NullDiscovery : provider::DiscoveryListener
{
    int found = 0;
    void on_endpoint_found(const std::string &, const provider::DiscoveredEndpointInfo &) override
    {
        ++found;
    }
    void on_endpoint_lost(const std::string &) override {}
};

class BluezTest : public ::testing::Test
{
  protected:
    void SetUp() override { ncbridge::set_log_level(ncbridge::Level::Error); }
    void TearDown() override { ncbridge::set_log_level(ncbridge::Level::Info); }
};
}  // namespace

TEST(BluezUtil, PathToAddr)
{
    EXPECT_EQ(provider::dbus::addr_from_path("/org/bluez/hci0/dev_aa_bb_cc_dd_ee_ff"), "AA:BB:CC:DD:EE:FF");
    EXPECT_EQ(provider::dbus::addr_from_path("/org/bluez/hci0"), "");
}

TEST(BluezUtil, BluetoothUsable)
{
    EXPECT_TRUE(provider::bluetooth_usable(std::nullopt));
    EXPECT_TRUE(provider::bluetooth_usable(MediumSet{Medium::Ble, Medium::WifiAware}));
    EXPECT_TRUE(provider::bluetooth_usable(MediumSet{Medium::Bluetooth}));
    EXPECT_TRUE(provider::bluetooth_usable(MediumSet{Medium::BleL2cap}));
    EXPECT_FALSE(provider::bluetooth_usable(MediumSet{Medium::WifiLan}));
    EXPECT_FALSE(provider::bluetooth_usable(MediumSet{}));
}

TEST_F(BluezTest, NonBluetoothMediumsAreUnsupported)
{
    provider::BluezProvider p(provider::BluezSettings{"hci0"});
    EXPECT_EQ(p.name(), "bluez");
    EXPECT_EQ(p.local_endpoint_id().size(), 4u);

    auto adv = medium::advertising_options(medium::MediumSelector::WifiLanOnly,
                                           medium::MediumSelector::Auto);
    EXPECT_EQ(p.start_advertising("me", "svc", nullptr, adv),
              provider::status::kUnsupportedMedium);

    auto disc = medium::discovery_options(medium::MediumSelector::WifiLanOnly);
    EXPECT_EQ(p.start_discovery("svc", std::make_shared<NullDiscovery>(), disc),
              provider::status::kUnsupportedMedium);
}

TEST_F(BluezTest, ConnectionsAndPayloadsAreUnsupported)
{
    provider::BluezProvider p(provider::BluezSettings{});
    EXPECT_EQ(p.request_connection("me", "AA:BB", nullptr, medium::ConnectionOptions{}),
              provider::status::kUnsupportedMedium);
    EXPECT_EQ(p.accept_connection("AA:BB", nullptr), provider::status::kUnsupportedMedium);
    EXPECT_EQ(p.send_payload("AA:BB", provider::Payload{}), provider::status::kUnsupportedMedium);
    EXPECT_EQ(p.disconnect_from_endpoint("AA:BB"), provider::status::kNotConnectedToEndpoint);
    EXPECT_EQ(p.stop_advertising(), provider::status::kSuccess);
    EXPECT_EQ(p.stop_discovery(), provider::status::kSuccess);
}

TEST_F(BluezTest, DevicesIgnoredWhileNotDiscovering)
{
    provider::BluezProvider p(provider::BluezSettings{});
    p.on_device_seen("/org/bluez/hci0/dev_11_22_33_44_55_66", "", "x", true);
    p.on_device_gone("/org/bluez/hci0/dev_11_22_33_44_55_66");
    SUCCEED();
}

TEST_F(BluezTest, BridgeSurfacesUnsupportedStatus)
{
    provider::BluezProvider   p(provider::BluezSettings{});
    events::EventCache        cache;
    bridge::ConnectionsBridge b(p, cache, "/tmp/ncbridge-bluez-ut");

    try
    {
        b.start_advertising("adv", "me", "svc", 3 /* wifi-lan only */, 0);
        FAIL() << "expected a provider failure";
    }
    catch (const ncbridge::BridgeError &e)
    {
        EXPECT_EQ(e.kind(), ncbridge::ErrorKind::ProviderCallFailure);
        EXPECT_NE(std::string(e.what()).find("UNSUPPORTED_MEDIUM"), std::string::npos);
    }
    // no onSuccess for a rejected request
    EXPECT_EQ(cache.size(), 0u);
}
