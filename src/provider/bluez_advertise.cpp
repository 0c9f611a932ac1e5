// src/provider/bluez_advertise.cpp
#include <cerrno>
#include <cstring>
#include <mutex>

// clang-format off
#include "provider/bluez_provider.hpp"
#include "provider/bluez_provider_impl.hpp"
#include "util/log.hpp"
// clang-format on

#if NCBRIDGE_HAVE_SDBUS
#include <systemd/sd-bus.h>
#include "provider/bluez_dbus_util.hpp"

namespace
{
constexpr const char *kAdvManager = "org.bluez.LEAdvertisingManager1";

// One getter serves every LEAdvertisement1 property; `prop` selects the value.
int adv_get(sd_bus * /*bus*/, const char * /*path*/, const char * /*iface*/, const char *prop,
            sd_bus_message *reply, void *userdata, sd_bus_error * /*ret*/)
{
    const auto *self = static_cast<const provider::BluezProvider *>(userdata);

    if (std::strcmp(prop, "Type") == 0)
        return sd_bus_message_append(reply, "s", "peripheral");
    if (std::strcmp(prop, "LocalName") == 0)
        return sd_bus_message_append(reply, "s", self->adv_name().c_str());
    if (std::strcmp(prop, "ServiceUUIDs") == 0)
        return sd_bus_message_append(reply, "as", 1, self->adv_uuid().c_str());
    if (std::strcmp(prop, "Discoverable") == 0)
        return sd_bus_message_append(reply, "b", 1);
    return -ENOENT;
}

// BlueZ calls Release when it drops the advertisement on its own
int adv_release(sd_bus_message *m, void * /*userdata*/, sd_bus_error * /*ret*/)
{
    LOG_WARN("[BLUEZ] advertisement released by bluetoothd");
    return sd_bus_reply_method_return(m, "");
}

int on_register_reply(sd_bus_message *m, void * /*userdata*/, sd_bus_error * /*ret*/)
{
    const sd_bus_error *e = sd_bus_message_get_error(m);
    if (e && sd_bus_error_is_set(e))
        LOG_ERROR("[BLUEZ] RegisterAdvertisement rejected: %s (%s)",
                  e->message ? e->message : "no message", e->name);
    else
        LOG_SYSTEM("[BLUEZ] advertisement is live");
    return 1;
}

const sd_bus_vtable adv_vtable[] = {
    SD_BUS_VTABLE_START(0),
    SD_BUS_PROPERTY("Type", "s", adv_get, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("LocalName", "s", adv_get, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("ServiceUUIDs", "as", adv_get, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_PROPERTY("Discoverable", "b", adv_get, 0, SD_BUS_VTABLE_PROPERTY_CONST),
    SD_BUS_METHOD("Release", "", "", adv_release, SD_BUS_VTABLE_UNPRIVILEGED),
    SD_BUS_VTABLE_END};

}  // namespace
#endif

namespace provider
{

// ======================================================================
// Function: BluezProvider::register_advertisement
// - In: bus open, adv_name / adv_uuid set
// - Out: LEAdvertisement1 exported at adv_path, RegisterAdvertisement sent
// - Note: the reply lands on the bus thread
// ======================================================================
bool BluezProvider::register_advertisement()
{
#if !NCBRIDGE_HAVE_SDBUS
    return false;
#else
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus)
        return false;

    const char *obj = impl_->adv_path.c_str();
    int r = sd_bus_add_object_vtable(impl_->bus, &impl_->adv_obj_slot, obj,
                                     "org.bluez.LEAdvertisement1", adv_vtable, this);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] cannot export %s: %s", obj, std::strerror(-r));
        return false;
    }

    // RegisterAdvertisement(o advertisement, a{sv} options) with no options
    r = sd_bus_call_method_async(impl_->bus, &impl_->adv_call_slot, "org.bluez",
                                 impl_->adapter_path.c_str(), kAdvManager, "RegisterAdvertisement",
                                 on_register_reply, this, "oa{sv}", obj, 0);
    if (r < 0)
    {
        LOG_ERROR("[BLUEZ] cannot send RegisterAdvertisement: %s", std::strerror(-r));
        dbus::release_slot(impl_->adv_obj_slot);
        return false;
    }
    impl_->advertising = true;
    return true;
#endif
}

void BluezProvider::unregister_advertisement()
{
#if NCBRIDGE_HAVE_SDBUS
    std::lock_guard<std::mutex> lk(impl_->bus_mu);
    if (!impl_->bus || !impl_->advertising)
        return;

    sd_bus_error err = SD_BUS_ERROR_NULL;
    const int    r   = sd_bus_call_method(impl_->bus, "org.bluez", impl_->adapter_path.c_str(),
                                          kAdvManager, "UnregisterAdvertisement", &err, nullptr,
                                          "o", impl_->adv_path.c_str());
    if (r < 0)
        LOG_WARN("[BLUEZ] UnregisterAdvertisement: %s",
                 err.message ? err.message : std::strerror(-r));
    sd_bus_error_free(&err);

    dbus::release_slot(impl_->adv_call_slot);
    dbus::release_slot(impl_->adv_obj_slot);
    impl_->advertising = false;
    LOG_SYSTEM("[BLUEZ] advertising stopped on %s", impl_->adapter_path.c_str());
#endif
}

}  // namespace provider
