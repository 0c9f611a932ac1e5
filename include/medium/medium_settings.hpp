#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/*
Driver selector  ->  resolver  ->  options handed to the provider

  advertising_options(adv, upg)   { advertising mediums?, upgrade mediums?, auto_upgrade, low_power }
  discovery_options(disc)         { discovery mediums? }
  connection_options(conn, upg,   { connection mediums?, upgrade mediums?, type?, keep-alive? }
                     type, ka...)

An unset (nullopt) medium list leaves the choice to the provider.
*/

namespace medium
{

// Concrete radio transports, numbered as the provider reports them.
enum class Medium : int
{
    Unknown     = 0,
    Mdns        = 1,
    Bluetooth   = 2,
    WifiHotspot = 3,
    Ble         = 4,
    WifiLan     = 5,
    WifiAware   = 6,
    Nfc         = 7,
    WifiDirect  = 8,
    WebRtc      = 9,
    BleL2cap    = 10,
    Usb         = 11,
};

// Test-facing selector values; keep in sync with the driver's constants.
enum class MediumSelector : int
{
    Auto             = 0,
    BtOnly           = 1,
    BleOnly          = 2,
    WifiLanOnly      = 3,
    WifiAwareOnly    = 4,
    UpgradeToWebRtc  = 5,
    UpgradeToHotspot = 6,
    UpgradeToDirect  = 7,
    BleL2capOnly     = 8,
    UpgradeToAllWifi = 9,
};

enum class UpgradeType : int
{
    Disruptive    = 1,
    NonDisruptive = 2,
};

enum class Strategy
{
    PointToPoint,
};

using MediumSet = std::vector<Medium>;

struct AdvertisingOptions
{
    Strategy                 strategy = Strategy::PointToPoint;
    std::optional<MediumSet> advertising_mediums;
    std::optional<MediumSet> upgrade_mediums;
    bool                     auto_upgrade_bandwidth       = false;
    bool                     enforce_topology_constraints = true;
    bool                     low_power                    = false;
};

struct DiscoveryOptions
{
    Strategy                 strategy = Strategy::PointToPoint;
    std::optional<MediumSet> discovery_mediums;
    bool                     low_power                              = false;
    bool                     forward_unrecognized_bluetooth_devices = false;
};

struct ConnectionOptions
{
    Strategy                    strategy = Strategy::PointToPoint;
    std::optional<MediumSet>    connection_mediums;
    std::optional<MediumSet>    upgrade_mediums;
    std::optional<UpgradeType>  connection_type;
    std::optional<std::int32_t> keep_alive_timeout_ms;
    std::optional<std::int32_t> keep_alive_interval_ms;
};

// Throw ncbridge::BridgeError(InvalidArgument) on an unrecognized selector.
AdvertisingOptions advertising_options(MediumSelector advertise, MediumSelector upgrade);
ConnectionOptions  connection_options(MediumSelector connect,
                                      MediumSelector upgrade,
                                      int            upgrade_type,
                                      std::int32_t   keep_alive_timeout_ms,
                                      std::int32_t   keep_alive_interval_ms);

// Never throws: an unrecognized selector yields unconstrained discovery.
DiscoveryOptions discovery_options(MediumSelector discover);

const char *medium_name(Medium m);
std::string medium_set_str(const std::optional<MediumSet> &set);

}  // namespace medium
