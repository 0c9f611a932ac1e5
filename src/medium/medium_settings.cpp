#include <string>

#include "medium/medium_settings.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace medium
{

namespace
{

[[noreturn]] void unsupported(const char *phase, MediumSelector sel)
{
    const std::string msg = std::string("Unsupported ") + phase +
                            " medium: " + std::to_string(static_cast<int>(sel));
    LOG_ERROR("%s", msg.c_str());
    throw ncbridge::BridgeError(ncbridge::ErrorKind::InvalidArgument, msg);
}

// Upgrade candidates offered at advertise time. The low-energy chain follows the
// target medium so the provider can fall back when the upgrade fails.
std::optional<MediumSet> advertise_upgrade_set(MediumSelector upgrade,
                                               bool          &auto_upgrade,
                                               bool          &low_power)
{
    auto_upgrade = true;
    low_power    = false;
    switch (upgrade)
    {
        case MediumSelector::Auto:
            return std::nullopt;
        case MediumSelector::BtOnly:
            auto_upgrade = false;
            return MediumSet{Medium::Bluetooth};
        case MediumSelector::BleOnly:
        case MediumSelector::BleL2capOnly:
            auto_upgrade = false;
            low_power    = true;
            return MediumSet{Medium::Ble};
        case MediumSelector::WifiLanOnly:
            return MediumSet{Medium::WifiLan};
        case MediumSelector::WifiAwareOnly:
            return MediumSet{Medium::WifiAware, Medium::BleL2cap, Medium::Bluetooth, Medium::Ble};
        case MediumSelector::UpgradeToWebRtc:
            return MediumSet{Medium::WebRtc, Medium::BleL2cap, Medium::Bluetooth, Medium::Ble};
        case MediumSelector::UpgradeToHotspot:
            return MediumSet{Medium::WifiHotspot, Medium::BleL2cap, Medium::Bluetooth,
                             Medium::Ble};
        case MediumSelector::UpgradeToDirect:
            return MediumSet{Medium::WifiDirect, Medium::BleL2cap, Medium::Bluetooth, Medium::Ble};
        case MediumSelector::UpgradeToAllWifi:
            // aware stays out of the final upgrade candidates
            return MediumSet{Medium::WifiDirect, Medium::WifiHotspot, Medium::WifiLan};
    }
    unsupported("upgrade", upgrade);
}

}  // namespace

AdvertisingOptions advertising_options(MediumSelector advertise, MediumSelector upgrade)
{
    AdvertisingOptions opts{};

    switch (advertise)
    {
        case MediumSelector::Auto:
            opts.advertising_mediums = std::nullopt;
            break;
        case MediumSelector::BtOnly:
            opts.advertising_mediums = MediumSet{Medium::Bluetooth};
            break;
        case MediumSelector::BleOnly:
        case MediumSelector::BleL2capOnly:
            opts.advertising_mediums = MediumSet{Medium::Ble};
            break;
        case MediumSelector::WifiLanOnly:
            opts.advertising_mediums = MediumSet{Medium::WifiLan};
            break;
        case MediumSelector::WifiAwareOnly:
            opts.advertising_mediums = MediumSet{Medium::Ble, Medium::WifiAware};
            break;
        case MediumSelector::UpgradeToWebRtc:
        case MediumSelector::UpgradeToHotspot:
        case MediumSelector::UpgradeToDirect:
        case MediumSelector::UpgradeToAllWifi:
            // advertise on the bootstrap channel only, the target joins at upgrade time
            opts.advertising_mediums = MediumSet{Medium::Ble};
            break;
        default:
            unsupported("advertising", advertise);
    }

    opts.upgrade_mediums = advertise_upgrade_set(upgrade, opts.auto_upgrade_bandwidth,
                                                 opts.low_power);
    return opts;
}

DiscoveryOptions discovery_options(MediumSelector discover)
{
    DiscoveryOptions opts{};

    switch (discover)
    {
        case MediumSelector::Auto:
            break;
        case MediumSelector::BtOnly:
            opts.discovery_mediums = MediumSet{Medium::Bluetooth};
            break;
        case MediumSelector::BleOnly:
        case MediumSelector::BleL2capOnly:
            opts.discovery_mediums = MediumSet{Medium::Ble};
            break;
        case MediumSelector::WifiLanOnly:
            opts.discovery_mediums = MediumSet{Medium::WifiLan};
            break;
        case MediumSelector::WifiAwareOnly:
            opts.discovery_mediums = MediumSet{Medium::Ble, Medium::WifiAware};
            break;
        case MediumSelector::UpgradeToWebRtc:
        case MediumSelector::UpgradeToHotspot:
        case MediumSelector::UpgradeToDirect:
        case MediumSelector::UpgradeToAllWifi:
            // only the bootstrap channel is discovered, the upgrade target comes later
            opts.discovery_mediums = MediumSet{Medium::Ble};
            break;
        default:
            // kept for compatibility with existing drivers: no error, no constraint
            LOG_WARN("unrecognized discovery medium %d, leaving discovery unconstrained",
                     static_cast<int>(discover));
            break;
    }
    return opts;
}

ConnectionOptions connection_options(MediumSelector connect,
                                     MediumSelector upgrade,
                                     int            upgrade_type,
                                     std::int32_t   keep_alive_timeout_ms,
                                     std::int32_t   keep_alive_interval_ms)
{
    ConnectionOptions opts{};

    if (upgrade_type == static_cast<int>(UpgradeType::Disruptive))
        opts.connection_type = UpgradeType::Disruptive;
    else if (upgrade_type == static_cast<int>(UpgradeType::NonDisruptive))
        opts.connection_type = UpgradeType::NonDisruptive;

    if (keep_alive_timeout_ms != 0)
        opts.keep_alive_timeout_ms = keep_alive_timeout_ms;
    if (keep_alive_interval_ms != 0)
        opts.keep_alive_interval_ms = keep_alive_interval_ms;

    switch (connect)
    {
        case MediumSelector::Auto:
            break;
        case MediumSelector::BtOnly:
            opts.connection_mediums = MediumSet{Medium::Bluetooth};
            break;
        case MediumSelector::BleOnly:
            opts.connection_mediums = MediumSet{Medium::Ble};
            break;
        case MediumSelector::BleL2capOnly:
            opts.connection_mediums = MediumSet{Medium::BleL2cap};
            break;
        case MediumSelector::WifiLanOnly:
            opts.connection_mediums = MediumSet{Medium::WifiLan};
            break;
        case MediumSelector::WifiAwareOnly:
            opts.connection_mediums = MediumSet{Medium::Bluetooth, Medium::Ble, Medium::BleL2cap,
                                                Medium::WifiAware};
            break;
        case MediumSelector::UpgradeToWebRtc:
            opts.connection_mediums = MediumSet{Medium::Bluetooth, Medium::Ble, Medium::BleL2cap,
                                                Medium::WebRtc};
            break;
        case MediumSelector::UpgradeToHotspot:
            opts.connection_mediums = MediumSet{Medium::Bluetooth, Medium::Ble, Medium::BleL2cap,
                                                Medium::WifiHotspot};
            break;
        case MediumSelector::UpgradeToDirect:
            opts.connection_mediums = MediumSet{Medium::Bluetooth, Medium::Ble, Medium::BleL2cap,
                                                Medium::WifiDirect};
            break;
        case MediumSelector::UpgradeToAllWifi:
            opts.connection_mediums = MediumSet{Medium::Bluetooth,  Medium::Ble,
                                                Medium::BleL2cap,   Medium::WifiDirect,
                                                Medium::WifiHotspot, Medium::WifiAware};
            break;
        default:
            unsupported("connection", connect);
    }

    switch (upgrade)
    {
        case MediumSelector::Auto:
            break;
        case MediumSelector::BtOnly:
            opts.upgrade_mediums = MediumSet{Medium::Bluetooth, Medium::Ble};
            break;
        case MediumSelector::BleOnly:
        case MediumSelector::BleL2capOnly:
            opts.upgrade_mediums = MediumSet{Medium::BleL2cap};
            break;
        case MediumSelector::WifiLanOnly:
            opts.upgrade_mediums = MediumSet{Medium::WifiLan};
            break;
        case MediumSelector::WifiAwareOnly:
            opts.upgrade_mediums = MediumSet{Medium::WifiAware, Medium::BleL2cap,
                                             Medium::Bluetooth, Medium::Ble};
            break;
        case MediumSelector::UpgradeToWebRtc:
            opts.upgrade_mediums = MediumSet{Medium::WebRtc, Medium::BleL2cap, Medium::Bluetooth,
                                             Medium::Ble};
            break;
        case MediumSelector::UpgradeToHotspot:
            opts.upgrade_mediums = MediumSet{Medium::WifiHotspot, Medium::BleL2cap,
                                             Medium::Bluetooth, Medium::Ble};
            break;
        case MediumSelector::UpgradeToDirect:
            opts.upgrade_mediums = MediumSet{Medium::WifiDirect, Medium::BleL2cap,
                                             Medium::Bluetooth, Medium::Ble};
            break;
        case MediumSelector::UpgradeToAllWifi:
            opts.upgrade_mediums = MediumSet{Medium::WifiDirect, Medium::WifiHotspot,
                                             Medium::WifiLan};
            break;
        default:
            unsupported("connection upgrade", upgrade);
    }

    return opts;
}

const char *medium_name(Medium m)
{
    switch (m)
    {
        case Medium::Unknown:
            return "UNKNOWN";
        case Medium::Mdns:
            return "MDNS";
        case Medium::Bluetooth:
            return "BLUETOOTH";
        case Medium::WifiHotspot:
            return "WIFI_HOTSPOT";
        case Medium::Ble:
            return "BLE";
        case Medium::WifiLan:
            return "WIFI_LAN";
        case Medium::WifiAware:
            return "WIFI_AWARE";
        case Medium::Nfc:
            return "NFC";
        case Medium::WifiDirect:
            return "WIFI_DIRECT";
        case Medium::WebRtc:
            return "WEB_RTC";
        case Medium::BleL2cap:
            return "BLE_L2CAP";
        case Medium::Usb:
            return "USB";
    }
    return "?";
}

std::string medium_set_str(const std::optional<MediumSet> &set)
{
    if (!set)
        return "(any)";
    std::string out = "[";
    for (std::size_t i = 0; i < set->size(); ++i)
    {
        if (i)
            out += ",";
        out += medium_name((*set)[i]);
    }
    out += "]";
    return out;
}

}  // namespace medium
