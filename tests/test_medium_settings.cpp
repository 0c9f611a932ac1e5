#include <algorithm>
#include <gtest/gtest.h>
#include <optional>
#include <string>

#include "medium/medium_settings.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

using namespace medium;

namespace
{
bool contains(const std::optional<MediumSet> &set, Medium m)
{
    return set && std::find(set->begin(), set->end(), m) != set->end();
}

MediumSelector sel(int v)
{
    return static_cast<MediumSelector>(v);
}
}  // namespace

TEST(MediumSettings, DiscoveryWifiLanOnly)
{
    auto opts = discovery_options(MediumSelector::WifiLanOnly);
    ASSERT_TRUE(opts.discovery_mediums.has_value());
    EXPECT_EQ(*opts.discovery_mediums, (MediumSet{Medium::WifiLan}));
}

TEST(MediumSettings, DiscoveryWifiAwareOnly)
{
    auto opts = discovery_options(MediumSelector::WifiAwareOnly);
    ASSERT_TRUE(opts.discovery_mediums.has_value());
    EXPECT_EQ(*opts.discovery_mediums, (MediumSet{Medium::Ble, Medium::WifiAware}));
}

TEST(MediumSettings, DiscoveryUnknownSelectorIsUnconstrained)
{
    ncbridge::set_log_level(ncbridge::Level::Error);
    for (int v : {-1, 10, 42, 1000})
    {
        DiscoveryOptions opts;
        EXPECT_NO_THROW(opts = discovery_options(sel(v)));
        EXPECT_FALSE(opts.discovery_mediums.has_value()) << "selector " << v;
    }
    ncbridge::set_log_level(ncbridge::Level::Info);
}

TEST(MediumSettings, AdvertiseAutoUpgrade)
{
    auto opts = advertising_options(MediumSelector::BleOnly, MediumSelector::Auto);
    EXPECT_TRUE(opts.auto_upgrade_bandwidth);
    EXPECT_FALSE(opts.upgrade_mediums.has_value());
    EXPECT_FALSE(opts.low_power);
    EXPECT_EQ(*opts.advertising_mediums, (MediumSet{Medium::Ble}));
}

TEST(MediumSettings, AdvertiseLowEnergyUpgradeIsLowPower)
{
    auto opts = advertising_options(MediumSelector::Auto, MediumSelector::BleOnly);
    EXPECT_FALSE(opts.advertising_mediums.has_value());
    EXPECT_FALSE(opts.auto_upgrade_bandwidth);
    EXPECT_TRUE(opts.low_power);
    EXPECT_EQ(*opts.upgrade_mediums, (MediumSet{Medium::Ble}));
}

TEST(MediumSettings, UpgradeTargetsStayOutOfAdvertiseAndDiscover)
{
    const MediumSelector upgrading[] = {MediumSelector::UpgradeToWebRtc,
                                        MediumSelector::UpgradeToHotspot,
                                        MediumSelector::UpgradeToDirect,
                                        MediumSelector::UpgradeToAllWifi};
    for (MediumSelector s : upgrading)
    {
        auto adv  = advertising_options(s, s);
        auto disc = discovery_options(s);
        EXPECT_EQ(adv.advertising_mediums, (MediumSet{Medium::Ble})) << static_cast<int>(s);
        EXPECT_EQ(disc.discovery_mediums, (MediumSet{Medium::Ble})) << static_cast<int>(s);

        // every upgrade target is missing from both bootstrap sets
        for (Medium m : *adv.upgrade_mediums)
        {
            if (m == Medium::Ble)
                continue;
            EXPECT_FALSE(contains(adv.advertising_mediums, m)) << medium_name(m);
            EXPECT_FALSE(contains(disc.discovery_mediums, m)) << medium_name(m);
        }
    }
}

TEST(MediumSettings, UpgradeChainFallsBackThroughBluetooth)
{
    auto opts = connection_options(MediumSelector::Auto, MediumSelector::UpgradeToWebRtc, 0, 0, 0);
    EXPECT_EQ(*opts.upgrade_mediums,
              (MediumSet{Medium::WebRtc, Medium::BleL2cap, Medium::Bluetooth, Medium::Ble}));
}

TEST(MediumSettings, UpgradeSetsNeverContainWifiAwareForAllWifi)
{
    // UpgradeToAllWifi is the only selector that widens across wifi mediums;
    // aware must still stay out of the upgrade candidates
    auto adv =
        advertising_options(MediumSelector::Auto, MediumSelector::UpgradeToAllWifi);
    auto conn = connection_options(MediumSelector::Auto, MediumSelector::UpgradeToAllWifi, 0, 0, 0);
    EXPECT_FALSE(contains(adv.upgrade_mediums, Medium::WifiAware));
    EXPECT_FALSE(contains(conn.upgrade_mediums, Medium::WifiAware));

    for (int v = 1; v <= 9; ++v)
    {
        if (sel(v) == MediumSelector::WifiAwareOnly)
            continue;
        auto a = advertising_options(MediumSelector::Auto, sel(v));
        auto c = connection_options(MediumSelector::Auto, sel(v), 0, 0, 0);
        EXPECT_FALSE(contains(a.upgrade_mediums, Medium::WifiAware)) << "selector " << v;
        EXPECT_FALSE(contains(c.upgrade_mediums, Medium::WifiAware)) << "selector " << v;
    }
}

TEST(MediumSettings, ResolutionIsDeterministic)
{
    for (int a = 0; a <= 9; ++a)
    {
        for (int u = 0; u <= 9; ++u)
        {
            auto x = advertising_options(sel(a), sel(u));
            auto y = advertising_options(sel(a), sel(u));
            EXPECT_EQ(x.advertising_mediums, y.advertising_mediums);
            EXPECT_EQ(x.upgrade_mediums, y.upgrade_mediums);
            EXPECT_EQ(x.auto_upgrade_bandwidth, y.auto_upgrade_bandwidth);
            EXPECT_EQ(x.low_power, y.low_power);

            auto c1 = connection_options(sel(a), sel(u), 1, 5000, 1000);
            auto c2 = connection_options(sel(a), sel(u), 1, 5000, 1000);
            EXPECT_EQ(c1.connection_mediums, c2.connection_mediums);
            EXPECT_EQ(c1.upgrade_mediums, c2.upgrade_mediums);
        }
        EXPECT_EQ(discovery_options(sel(a)).discovery_mediums,
                  discovery_options(sel(a)).discovery_mediums);
    }
}

namespace
{
constexpr Medium kBt    = Medium::Bluetooth;
constexpr Medium kBle   = Medium::Ble;
constexpr Medium kL2cap = Medium::BleL2cap;
constexpr Medium kLan   = Medium::WifiLan;
constexpr Medium kAware = Medium::WifiAware;
constexpr Medium kHot   = Medium::WifiHotspot;
constexpr Medium kDir   = Medium::WifiDirect;
constexpr Medium kRtc   = Medium::WebRtc;

const std::optional<MediumSet> kAny = std::nullopt;

// Expected resolution of one selector in every phase.
struct SelectorRow
{
    MediumSelector           selector;
    std::optional<MediumSet> advertise;
    std::optional<MediumSet> discover;
    std::optional<MediumSet> connect;
    std::optional<MediumSet> advertise_upgrade;
    bool                     auto_upgrade;
    bool                     low_power;
    std::optional<MediumSet> connect_upgrade;
};

const SelectorRow kTable[] = {
    {MediumSelector::Auto, kAny, kAny, kAny, kAny, true, false, kAny},
    {MediumSelector::BtOnly, MediumSet{kBt}, MediumSet{kBt}, MediumSet{kBt}, MediumSet{kBt},
     false, false, MediumSet{kBt, kBle}},
    {MediumSelector::BleOnly, MediumSet{kBle}, MediumSet{kBle}, MediumSet{kBle},
     MediumSet{kBle}, false, true, MediumSet{kL2cap}},
    {MediumSelector::WifiLanOnly, MediumSet{kLan}, MediumSet{kLan}, MediumSet{kLan},
     MediumSet{kLan}, true, false, MediumSet{kLan}},
    {MediumSelector::WifiAwareOnly, MediumSet{kBle, kAware}, MediumSet{kBle, kAware},
     MediumSet{kBt, kBle, kL2cap, kAware}, MediumSet{kAware, kL2cap, kBt, kBle}, true, false,
     MediumSet{kAware, kL2cap, kBt, kBle}},
    {MediumSelector::UpgradeToWebRtc, MediumSet{kBle}, MediumSet{kBle},
     MediumSet{kBt, kBle, kL2cap, kRtc}, MediumSet{kRtc, kL2cap, kBt, kBle}, true, false,
     MediumSet{kRtc, kL2cap, kBt, kBle}},
    {MediumSelector::UpgradeToHotspot, MediumSet{kBle}, MediumSet{kBle},
     MediumSet{kBt, kBle, kL2cap, kHot}, MediumSet{kHot, kL2cap, kBt, kBle}, true, false,
     MediumSet{kHot, kL2cap, kBt, kBle}},
    {MediumSelector::UpgradeToDirect, MediumSet{kBle}, MediumSet{kBle},
     MediumSet{kBt, kBle, kL2cap, kDir}, MediumSet{kDir, kL2cap, kBt, kBle}, true, false,
     MediumSet{kDir, kL2cap, kBt, kBle}},
    {MediumSelector::BleL2capOnly, MediumSet{kBle}, MediumSet{kBle}, MediumSet{kL2cap},
     MediumSet{kBle}, false, true, MediumSet{kL2cap}},
    {MediumSelector::UpgradeToAllWifi, MediumSet{kBle}, MediumSet{kBle},
     MediumSet{kBt, kBle, kL2cap, kDir, kHot, kAware}, MediumSet{kDir, kHot, kLan}, true, false,
     MediumSet{kDir, kHot, kLan}},
};
}  // namespace

TEST(MediumSettings, SelectorTable)
{
    ASSERT_EQ(sizeof(kTable) / sizeof(kTable[0]), 10u);
    for (const SelectorRow &row : kTable)
    {
        const int v = static_cast<int>(row.selector);
        SCOPED_TRACE("selector " + std::to_string(v));

        // advertise and upgrade selectors are resolved independently
        const auto adv = advertising_options(row.selector, MediumSelector::Auto);
        EXPECT_EQ(medium_set_str(adv.advertising_mediums), medium_set_str(row.advertise));
        EXPECT_FALSE(adv.upgrade_mediums.has_value());

        const auto up = advertising_options(MediumSelector::Auto, row.selector);
        EXPECT_FALSE(up.advertising_mediums.has_value());
        EXPECT_EQ(medium_set_str(up.upgrade_mediums), medium_set_str(row.advertise_upgrade));
        EXPECT_EQ(up.auto_upgrade_bandwidth, row.auto_upgrade);
        EXPECT_EQ(up.low_power, row.low_power);
        EXPECT_TRUE(up.enforce_topology_constraints);
        EXPECT_EQ(up.strategy, Strategy::PointToPoint);

        const auto disc = discovery_options(row.selector);
        EXPECT_EQ(medium_set_str(disc.discovery_mediums), medium_set_str(row.discover));
        EXPECT_FALSE(disc.low_power);
        EXPECT_FALSE(disc.forward_unrecognized_bluetooth_devices);

        const auto conn = connection_options(row.selector, MediumSelector::Auto, 0, 0, 0);
        EXPECT_EQ(medium_set_str(conn.connection_mediums), medium_set_str(row.connect));
        EXPECT_FALSE(conn.upgrade_mediums.has_value());

        const auto conn_up = connection_options(MediumSelector::Auto, row.selector, 0, 0, 0);
        EXPECT_FALSE(conn_up.connection_mediums.has_value());
        EXPECT_EQ(medium_set_str(conn_up.upgrade_mediums), medium_set_str(row.connect_upgrade));
    }
}

TEST(MediumSettings, UnknownSelectorsThrowInvalidArgument)
{
    ncbridge::set_log_level(ncbridge::Level::System);
    for (int v : {-1, 10, 99})
    {
        try
        {
            advertising_options(sel(v), MediumSelector::Auto);
            ADD_FAILURE() << "advertise selector " << v << " accepted";
        }
        catch (const ncbridge::BridgeError &e)
        {
            EXPECT_EQ(e.kind(), ncbridge::ErrorKind::InvalidArgument);
            EXPECT_NE(std::string(e.what()).find("advertising"), std::string::npos);
            EXPECT_NE(std::string(e.what()).find(std::to_string(v)), std::string::npos);
        }
        EXPECT_THROW(advertising_options(MediumSelector::Auto, sel(v)), ncbridge::BridgeError);
        EXPECT_THROW(connection_options(sel(v), MediumSelector::Auto, 0, 0, 0),
                     ncbridge::BridgeError);
        EXPECT_THROW(connection_options(MediumSelector::Auto, sel(v), 0, 0, 0),
                     ncbridge::BridgeError);
    }
    ncbridge::set_log_level(ncbridge::Level::Info);
}

TEST(MediumSettings, ConnectionTypeAndKeepAlive)
{
    auto none = connection_options(MediumSelector::BtOnly, MediumSelector::Auto, 0, 0, 0);
    EXPECT_FALSE(none.connection_type.has_value());
    EXPECT_FALSE(none.keep_alive_timeout_ms.has_value());
    EXPECT_FALSE(none.keep_alive_interval_ms.has_value());
    EXPECT_EQ(*none.connection_mediums, (MediumSet{Medium::Bluetooth}));

    auto set = connection_options(MediumSelector::BleL2capOnly, MediumSelector::BleOnly, 2,
                                  30000, 5000);
    EXPECT_EQ(set.connection_type, UpgradeType::NonDisruptive);
    EXPECT_EQ(set.keep_alive_timeout_ms, 30000);
    EXPECT_EQ(set.keep_alive_interval_ms, 5000);
    EXPECT_EQ(*set.connection_mediums, (MediumSet{Medium::BleL2cap}));
    EXPECT_EQ(*set.upgrade_mediums, (MediumSet{Medium::BleL2cap}));
}

TEST(MediumSettings, MediumSetStr)
{
    EXPECT_EQ(medium_set_str(std::nullopt), "(any)");
    EXPECT_EQ(medium_set_str(MediumSet{Medium::Ble, Medium::WifiLan}), "[BLE,WIFI_LAN]");
}
