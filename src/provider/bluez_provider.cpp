/* ======================================================================
 * BlueZ provider: overall flow
 *
 *  RPC thread                                   Provider                          BlueZ/DBus
 *  ----------                                   --------                          ----------
 *  start_advertising(name, service, opts)
 *    └─ medium check (bluetooth family only)
 *    └─ ensure_bus() + loop thread
 *    └─ register_advertisement() ───────────────────────────────────────────────▶  LEAdvertisingManager1.RegisterAdvertisement
 *
 *  start_discovery(service, listener, opts)
 *    └─ medium check
 *    └─ subscribe_device_signals() ─────────────────────────────────────────────▶  ObjectManager.InterfacesAdded/Removed
 *    └─ set_discovery_filter() ─────────────────────────────────────────────────▶  Adapter1.SetDiscoveryFilter
 *    └─ adapter_discovery(true) ────────────────────────────────────────────────▶  Adapter1.StartDiscovery
 *
 *  Bus thread
 *    └─ InterfacesAdded(dev_*)   -> listener.on_endpoint_found
 *    └─ InterfacesRemoved(dev_*) -> listener.on_endpoint_lost
 *
 *  Connections and payloads report the unsupported-medium status.
 *  DBus calls issued from the RPC thread are under impl_->bus_mu.
 * ====================================================================== */

#include <algorithm>
#include <cstring>
#include <mutex>

// clang-format off
#include "provider/bluez_provider.hpp"
#include "provider/bluez_provider_impl.hpp"
#include "util/ids.hpp"
#include "util/log.hpp"
// clang-format on

#if NCBRIDGE_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "provider/bluez_dbus_util.hpp"
#endif

namespace provider
{

bool bluetooth_usable(const std::optional<medium::MediumSet> &set)
{
    if (!set)
        return true;
    return std::any_of(set->begin(), set->end(), [](medium::Medium m) {
        return m == medium::Medium::Ble || m == medium::Medium::Bluetooth ||
               m == medium::Medium::BleL2cap;
    });
}

BluezProvider::BluezProvider(BluezSettings cfg)
    : cfg_(std::move(cfg)), local_id_(ids::new_endpoint_id()), impl_(std::make_unique<Impl>())
{
    impl_->adapter_path = "/org/bluez/" + cfg_.adapter;
}

BluezProvider::~BluezProvider()
{
    stop_all_endpoints();
    stop_bus();
}

const std::string &BluezProvider::adv_name() const
{
    return impl_->adv_name;
}
const std::string &BluezProvider::adv_uuid() const
{
    return impl_->adv_uuid;
}
const std::string &BluezProvider::scan_uuid() const
{
    return impl_->scan_uuid;
}

// ======================================================================
// Function: BluezProvider::ensure_bus
// - In: may be called repeatedly
// - Out: system bus connected and bus loop thread running
// ======================================================================
bool BluezProvider::ensure_bus()
{
#if !NCBRIDGE_HAVE_SDBUS
    LOG_ERROR("[BLUEZ] sd-bus not available (NCBRIDGE_HAVE_SDBUS=0)");
    return false;
#else
    if (impl_->running.load())
        return true;

    int r = sd_bus_open_system(&impl_->bus);
    if (r < 0 || !impl_->bus)
    {
        LOG_ERROR("[BLUEZ] failed to connect to system bus, err %d", r);
        return false;
    }

    impl_->running.store(true);
    impl_->loop = std::thread([this] {
        while (impl_->running.load(std::memory_order_relaxed))
        {
            std::lock_guard<std::mutex> lk(impl_->bus_mu);
            while (1)
            {
                int pr = sd_bus_process(impl_->bus, nullptr);
                if (pr <= 0)
                    break;
            }
            const uint64_t WAIT_USEC = 100000;  // 100ms
            sd_bus_wait(impl_->bus, WAIT_USEC);
        }
    });
    LOG_DEBUG("[BLUEZ] bus loop started on %s", impl_->adapter_path.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezProvider::stop_bus
// - In: advertising and discovery already stopped
// - Out: loop thread joined outside of locks, slots and bus released
// ======================================================================
void BluezProvider::stop_bus()
{
#if NCBRIDGE_HAVE_SDBUS
    if (!impl_->running.exchange(false))
        return;
    if (impl_->bus)
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        // wake the sd-bus loop if blocked in sd_bus_wait
        sd_bus_close(impl_->bus);
    }
    if (impl_->loop.joinable())
        impl_->loop.join();

    dbus::release_slot(impl_->adv_call_slot);
    dbus::release_slot(impl_->adv_obj_slot);
    dbus::release_slot(impl_->added_slot);
    dbus::release_slot(impl_->removed_slot);
    if (impl_->bus)
    {
        sd_bus_flush_close_unref(impl_->bus);
        impl_->bus = nullptr;
    }
#endif
}

// ---------------- advertising ----------------

int BluezProvider::start_advertising(const std::string                  &name,
                                     const std::string                  &service_id,
                                     std::shared_ptr<ConnectionListener> listener,
                                     const medium::AdvertisingOptions   &opts)
{
    (void)listener;  // BlueZ advertising never produces incoming connections here
    if (!bluetooth_usable(opts.advertising_mediums))
    {
        LOG_WARN("[BLUEZ] cannot advertise on %s",
                 medium::medium_set_str(opts.advertising_mediums).c_str());
        return status::kUnsupportedMedium;
    }
    if (!ensure_bus())
        return status::kError;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->advertising)
            return status::kAlreadyAdvertising;
        impl_->adv_name = name;
        impl_->adv_uuid = ids::service_uuid(service_id);
    }
    if (!register_advertisement())
        return status::kError;
    LOG_SYSTEM("[BLUEZ] advertising '%s' service=%s uuid=%s", name.c_str(), service_id.c_str(),
               impl_->adv_uuid.c_str());
    return status::kSuccess;
}

int BluezProvider::stop_advertising()
{
    unregister_advertisement();
    return status::kSuccess;
}

// ---------------- discovery ----------------

int BluezProvider::start_discovery(const std::string                 &service_id,
                                   std::shared_ptr<DiscoveryListener> listener,
                                   const medium::DiscoveryOptions    &opts)
{
    if (!listener)
        return status::kError;
    if (!bluetooth_usable(opts.discovery_mediums))
    {
        LOG_WARN("[BLUEZ] cannot discover on %s",
                 medium::medium_set_str(opts.discovery_mediums).c_str());
        return status::kUnsupportedMedium;
    }
    if (!ensure_bus())
        return status::kError;
    {
        std::lock_guard<std::mutex> lk(impl_->bus_mu);
        if (impl_->discovering)
            return status::kAlreadyDiscovering;
        impl_->scan_service_id = service_id;
        impl_->scan_uuid       = ids::service_uuid(service_id);
        impl_->disc_listener   = std::move(listener);
        impl_->found.clear();
    }
    if (!subscribe_device_signals())
        return status::kError;
    if (!set_discovery_filter())
        LOG_WARN("[BLUEZ] continuing without a UUID discovery filter");
    if (!adapter_discovery(true))
        return status::kError;
    return status::kSuccess;
}

int BluezProvider::stop_discovery()
{
    (void)adapter_discovery(false);
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->disc_listener.reset();
    impl_->found.clear();
    return status::kSuccess;
}

// ---------------- connections / payloads ----------------

int BluezProvider::request_connection(const std::string &name,
                                      const std::string &endpoint_id,
                                      std::shared_ptr<ConnectionListener> /*listener*/,
                                      const medium::ConnectionOptions & /*opts*/)
{
    LOG_WARN("[BLUEZ] '%s' -> %s: connections are not supported by this backend", name.c_str(),
             endpoint_id.c_str());
    return status::kUnsupportedMedium;
}

int BluezProvider::accept_connection(const std::string &endpoint_id,
                                     std::shared_ptr<PayloadListener> /*listener*/)
{
    LOG_WARN("[BLUEZ] accept %s: connections are not supported by this backend",
             endpoint_id.c_str());
    return status::kUnsupportedMedium;
}

int BluezProvider::disconnect_from_endpoint(const std::string &endpoint_id)
{
    LOG_DEBUG("[BLUEZ] disconnect %s: no connection", endpoint_id.c_str());
    return status::kNotConnectedToEndpoint;
}

int BluezProvider::send_payload(const std::string &endpoint_id, Payload payload)
{
    LOG_WARN("[BLUEZ] payload %lld to %s: payloads are not supported by this backend",
             (long long)payload.id, endpoint_id.c_str());
    return status::kUnsupportedMedium;
}

void BluezProvider::stop_all_endpoints()
{
    (void)stop_advertising();
    (void)stop_discovery();
}

}  // namespace provider
