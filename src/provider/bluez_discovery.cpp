/* ======================================================================
 * BlueZ discovery
 *
 *  RPC thread                        Bus thread                   BlueZ/DBus
 *  ----------                        ----------                   ----------
 *  subscribe_device_signals()
 *  set_discovery_filter() ──────────────────────────────────────▶  Adapter1.SetDiscoveryFilter(le, UUID)
 *  adapter_discovery(true) ─────────────────────────────────────▶  Adapter1.StartDiscovery
 *                                    ◀─── InterfacesAdded(dev_*) ─
 *                                       └─ on_device_seen -> endpoint found
 *                                    ◀─── InterfacesRemoved(dev_*)
 *                                       └─ on_device_gone -> endpoint lost
 *  adapter_discovery(false) ────────────────────────────────────▶  Adapter1.StopDiscovery
 * ====================================================================== */

#include <cerrno>
#include <cstring>
#include <mutex>
#include <string>

// clang-format off
#include "provider/bluez_dbus_util.hpp"
#include "provider/bluez_provider.hpp"
#include "provider/bluez_provider_impl.hpp"
#include "util/log.hpp"
// clang-format on

#if NCBRIDGE_HAVE_SDBUS
#include <systemd/sd-bus.h>

namespace
{
constexpr const char *kObjectManager = "org.freedesktop.DBus.ObjectManager";

const char *bus_error_text(const sd_bus_error &err, int r)
{
    return err.message ? err.message : std::strerror(-r);
}

// InterfacesAdded(o path, a{sa{sv}} interfaces)
int on_iface_added(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto *self = static_cast<provider::BluezProvider *>(userdata);

    const char *path = nullptr;
    int         r    = sd_bus_message_read_basic(m, 'o', &path);
    if (r < 0)
        return r;
    if (!path)
        return -EINVAL;

    const std::string dev_prefix = "/org/bluez/" + self->config().adapter + "/dev_";
    if (std::strncmp(path, dev_prefix.c_str(), dev_prefix.size()) != 0)
        return 0;

    provider::dbus::DeviceProps props;
    bool                        is_device = false;

    if ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sa{sv}}")) < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sa{sv}")) > 0)
    {
        const char *iface = nullptr;
        if ((r = sd_bus_message_read_basic(m, 's', &iface)) < 0)
            return r;
        if (iface && std::strcmp(iface, "org.bluez.Device1") == 0)
        {
            is_device = true;
            r         = provider::dbus::read_device_props(m, self->scan_uuid(), props);
        }
        else
        {
            r = sd_bus_message_skip(m, "a{sv}");
        }
        if (r < 0)
            return r;
        if ((r = sd_bus_message_exit_container(m)) < 0)
            return r;
    }
    if (r < 0)
        return r;
    if ((r = sd_bus_message_exit_container(m)) < 0)
        return r;

    if (is_device)
        self->on_device_seen(path, props.address, props.alias, props.has_service);
    return 0;
}

// InterfacesRemoved(o path, as interfaces)
int on_iface_removed(sd_bus_message *m, void *userdata, sd_bus_error * /*ret*/)
{
    auto       *self = static_cast<provider::BluezProvider *>(userdata);
    const char *path = nullptr;
    int         r    = sd_bus_message_read_basic(m, 'o', &path);
    if (r < 0)
        return r;
    if (!path)
        return -EINVAL;
    self->on_device_gone(path);
    return 0;
}

}  // namespace
#endif

namespace provider
{

// ======================================================================
// Function: BluezProvider::on_device_seen
// - In: bus thread, bus_mu held
// - Out: reports a device carrying the scanned service once per object path
// ======================================================================
void BluezProvider::on_device_seen(const std::string &obj_path,
                                   const std::string &addr,
                                   const std::string &alias,
                                   bool               svc_hit)
{
    if (!impl_->discovering || !impl_->disc_listener)
        return;
    // with the UUID filter accepted, BlueZ only surfaces matching devices
    const bool matches = svc_hit || impl_->uuid_filter_ok;
    if (!matches || impl_->found.count(obj_path) != 0)
        return;

    std::string endpoint_id = addr;
    if (endpoint_id.empty())
        endpoint_id = dbus::addr_from_path(obj_path);
    const std::string display = alias.empty() ? endpoint_id : alias;
    impl_->found[obj_path]    = endpoint_id;

    LOG_SYSTEM("[BLUEZ] endpoint %s (%s) advertises %s", endpoint_id.c_str(), display.c_str(),
               impl_->scan_service_id.c_str());
    impl_->disc_listener->on_endpoint_found(
        endpoint_id, DiscoveredEndpointInfo{display, impl_->scan_service_id});
}

void BluezProvider::on_device_gone(const std::string &obj_path)
{
    const auto it = impl_->found.find(obj_path);
    if (it == impl_->found.end())
        return;
    const std::string endpoint_id = std::move(it->second);
    impl_->found.erase(it);
    LOG_SYSTEM("[BLUEZ] endpoint %s lost", endpoint_id.c_str());
    if (impl_->disc_listener)
        impl_->disc_listener->on_endpoint_lost(endpoint_id);
}

bool BluezProvider::subscribe_device_signals()
{
#if !NCBRIDGE_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    struct Match
    {
        sd_bus_slot         **slot;
        const char           *member;
        sd_bus_message_handler_t handler;
    };
    const Match matches[] = {
        {&impl_->added_slot, "InterfacesAdded", on_iface_added},
        {&impl_->removed_slot, "InterfacesRemoved", on_iface_removed},
    };
    for (const Match &mt : matches)
    {
        if (*mt.slot)
            continue;
        const int r = sd_bus_match_signal(impl_->bus, mt.slot, "org.bluez", "/", kObjectManager,
                                          mt.member, mt.handler, this);
        if (r < 0)
        {
            LOG_ERROR("[BLUEZ] match on %s failed: %s", mt.member, std::strerror(-r));
            dbus::release_slot(impl_->added_slot);
            dbus::release_slot(impl_->removed_slot);
            return false;
        }
    }
    LOG_DEBUG("[BLUEZ] watching device objects under %s", impl_->adapter_path.c_str());
    return true;
#endif
}

// ======================================================================
// Function: BluezProvider::set_discovery_filter
// - In: bus valid, scan_uuid set
// - Out: Adapter1.SetDiscoveryFilter(Transport=le, DuplicateData=false, UUIDs=[uuid])
// - Note: uuid_filter_ok records whether BlueZ accepted it
// ======================================================================
bool BluezProvider::set_discovery_filter()
{
#if !NCBRIDGE_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    impl_->uuid_filter_ok = false;
    if (!impl_->bus)
        return false;

    sd_bus_message *call  = nullptr;
    sd_bus_message *reply = nullptr;
    sd_bus_error    err   = SD_BUS_ERROR_NULL;

    int r = sd_bus_message_new_method_call(impl_->bus, &call, "org.bluez",
                                           impl_->adapter_path.c_str(), "org.bluez.Adapter1",
                                           "SetDiscoveryFilter");
    if (r >= 0)
        r = sd_bus_message_open_container(call, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r >= 0)
        r = dbus::append_dict_entry(call, "Transport", "s", "le");
    if (r >= 0)
        r = dbus::append_dict_entry(call, "DuplicateData", "b", 0);
    if (r >= 0)
        r = dbus::append_dict_entry(call, "UUIDs", "as", 1, impl_->scan_uuid.c_str());
    if (r >= 0)
        r = sd_bus_message_close_container(call);
    if (r >= 0)
        r = sd_bus_call(impl_->bus, call, 0, &err, &reply);

    sd_bus_message_unref(call);
    sd_bus_message_unref(reply);
    if (r < 0)
        LOG_WARN("[BLUEZ] SetDiscoveryFilter(%s) failed: %s", impl_->scan_uuid.c_str(),
                 bus_error_text(err, r));
    else
        LOG_INFO("[BLUEZ] discovery filter set: le, uuid %s", impl_->scan_uuid.c_str());
    sd_bus_error_free(&err);

    impl_->uuid_filter_ok = r >= 0;
    return impl_->uuid_filter_ok;
#endif
}

// ======================================================================
// Function: BluezProvider::adapter_discovery
// - In: on = StartDiscovery, off = StopDiscovery
// - Out: true when the adapter ends up in the requested state
// - Note: StopDiscovery errors count as already off, InProgress as on
// ======================================================================
bool BluezProvider::adapter_discovery(bool on)
{
#if !NCBRIDGE_HAVE_SDBUS
    return !on;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return !on;
    if (impl_->discovering == on)
        return true;

    const char     *method = on ? "StartDiscovery" : "StopDiscovery";
    sd_bus_error    err    = SD_BUS_ERROR_NULL;
    sd_bus_message *reply  = nullptr;
    const int       r = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                           "org.bluez.Adapter1", method, &err, &reply, "");
    sd_bus_message_unref(reply);

    bool reached = true;
    if (r < 0 && on && !sd_bus_error_has_name(&err, "org.bluez.Error.InProgress"))
    {
        LOG_ERROR("[BLUEZ] %s failed: %s", method, bus_error_text(err, r));
        reached = false;
    }
    else if (r < 0)
    {
        LOG_WARN("[BLUEZ] %s returned %s, adapter already in that state", method,
                 bus_error_text(err, r));
    }
    sd_bus_error_free(&err);

    if (reached)
    {
        impl_->discovering = on;
        LOG_SYSTEM("[BLUEZ] %s on %s", method, impl_->adapter_path.c_str());
    }
    return reached;
#endif
}

}  // namespace provider
