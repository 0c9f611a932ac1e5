// include/provider/bluez_dbus_util.hpp
#pragma once
#include <cctype>
#include <cstring>
#include <string>
#include <strings.h>

#if NCBRIDGE_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace provider::dbus
{

// "/org/bluez/hci0/dev_aa_bb_cc_dd_ee_ff" -> "AA:BB:CC:DD:EE:FF", "" if not a device path
inline std::string addr_from_path(const std::string &obj_path)
{
    static const std::string marker = "/dev_";
    const auto               at     = obj_path.rfind(marker);
    if (at == std::string::npos)
        return {};
    std::string addr;
    addr.reserve(obj_path.size() - at - marker.size());
    for (std::size_t i = at + marker.size(); i < obj_path.size(); ++i)
    {
        const char c = obj_path[i];
        addr.push_back(c == '_' ? ':' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return addr;
}

inline bool same_uuid(const char *a, const std::string &b)
{
    return a && ::strcasecmp(a, b.c_str()) == 0;
}

#if NCBRIDGE_HAVE_SDBUS

inline void release_slot(sd_bus_slot *&slot)
{
    if (!slot)
        return;
    sd_bus_slot_unref(slot);
    slot = nullptr;
}

// Appends one "{sv}" entry; `sig` and `args` describe the variant payload.
template <typename... Args>
int append_dict_entry(sd_bus_message *m, const char *key, const char *sig, Args... args)
{
    int r = sd_bus_message_open_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv");
    if (r >= 0)
        r = sd_bus_message_append(m, "s", key);
    if (r >= 0)
        r = sd_bus_message_append(m, "v", sig, args...);
    if (r >= 0)
        r = sd_bus_message_close_container(m);
    return r;
}

inline int read_string_variant(sd_bus_message *m, std::string &out)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "s");
    if (r < 0)
        return r;
    const char *value = nullptr;
    r                 = sd_bus_message_read_basic(m, 's', &value);
    if (r > 0 && value)
        out = value;
    const int r_exit = sd_bus_message_exit_container(m);
    return r < 0 ? r : r_exit;
}

// Reads a variant "as", setting `found` when `uuid` is one of its entries.
inline int variant_lists_uuid(sd_bus_message *m, const std::string &uuid, bool &found)
{
    found = false;
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_VARIANT, "as");
    if (r < 0)
        return r;
    r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "s");
    if (r < 0)
        return r;
    const char *entry = nullptr;
    while ((r = sd_bus_message_read_basic(m, 's', &entry)) > 0)
        found = found || same_uuid(entry, uuid);
    if (r < 0)
        return r;
    r = sd_bus_message_exit_container(m);
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

struct DeviceProps
{
    std::string address;
    std::string alias;
    bool        has_service = false;
};

// Reads an org.bluez.Device1 property dict (a{sv}), keeping the fields discovery needs.
inline int read_device_props(sd_bus_message *m, const std::string &service_uuid,
                             DeviceProps &props)
{
    int r = sd_bus_message_enter_container(m, SD_BUS_TYPE_ARRAY, "{sv}");
    if (r < 0)
        return r;
    while ((r = sd_bus_message_enter_container(m, SD_BUS_TYPE_DICT_ENTRY, "sv")) > 0)
    {
        const char *key = nullptr;
        r               = sd_bus_message_read_basic(m, 's', &key);
        if (r < 0)
            return r;

        if (key && std::strcmp(key, "UUIDs") == 0)
        {
            bool listed = false;
            r           = variant_lists_uuid(m, service_uuid, listed);
            props.has_service = props.has_service || listed;
        }
        else if (key && std::strcmp(key, "Address") == 0)
            r = read_string_variant(m, props.address);
        else if (key && std::strcmp(key, "Alias") == 0)
            r = read_string_variant(m, props.alias);
        else
            r = sd_bus_message_skip(m, "v");
        if (r < 0)
            return r;

        r = sd_bus_message_exit_container(m);
        if (r < 0)
            return r;
    }
    if (r < 0)
        return r;
    return sd_bus_message_exit_container(m);
}

#endif

}  // namespace provider::dbus
