// include/provider/bluez_provider_impl.hpp
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct sd_bus;
struct sd_bus_slot;

#include "provider/bluez_provider.hpp"

namespace provider
{
struct BluezProvider::Impl
{
#if NCBRIDGE_HAVE_SDBUS
    sd_bus *bus = nullptr;
    // advertising
    sd_bus_slot *adv_obj_slot  = nullptr;  // LEAdvertisement1 vtable
    sd_bus_slot *adv_call_slot = nullptr;  // RegisterAdvertisement (async)
    // discovery
    sd_bus_slot *added_slot   = nullptr;
    sd_bus_slot *removed_slot = nullptr;
#endif
    // serialize all sd-bus access
    std::mutex       bus_mu;
    std::thread      loop;
    std::atomic_bool running{false};

    std::string adapter_path;  // "/org/bluez/hci0"
    std::string adv_path = "/org/ncbridge/adv0";

    // advertising state (guarded by bus_mu)
    bool        advertising{false};
    std::string adv_name;
    std::string adv_uuid;

    // discovery state (guarded by bus_mu)
    bool                               discovering{false};
    bool                               uuid_filter_ok{false};
    std::string                        scan_uuid;
    std::string                        scan_service_id;
    std::shared_ptr<DiscoveryListener> disc_listener;
    std::map<std::string, std::string> found;  // object path -> endpoint id
};
}  // namespace provider
