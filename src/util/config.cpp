#include <cstdlib>
#include <cstring>

#include "ctl/ipc.hpp"
#include "util/config.hpp"
#include "util/log.hpp"

namespace config
{

const char *provider_kind_name(ProviderKind kind)
{
    switch (kind)
    {
        case ProviderKind::Loopback:
            return "loopback";
        case ProviderKind::Bluez:
            return "bluez";
    }
    return "?";
}

Config load_from_env()
{
    Config c;

    if (const char *e = std::getenv("NCBRIDGE_LOG_LEVEL"); e && *e)
        c.log_level = e;

    if (const char *e = std::getenv("NCBRIDGE_PROVIDER"); e && *e)
    {
        if (std::strcmp(e, "bluez") == 0)
            c.provider = ProviderKind::Bluez;
        else if (std::strcmp(e, "loopback") != 0)
            LOG_WARN("Ignoring unknown NCBRIDGE_PROVIDER='%s' (expect loopback|bluez)", e);
    }

    if (const char *e = std::getenv("NCBRIDGE_ADAPTER"); e && *e)
        c.adapter = e;

    c.ctl_sock    = ipc::expand_user(constants::ctl_sock_path());
    c.payload_dir = ipc::expand_user(constants::payload_dir());

    if (const char *e = std::getenv("NCBRIDGE_EVENT_QUEUE_LIMIT"))
    {
        char         *p = nullptr;
        unsigned long v = std::strtoul(e, &p, 10);
        if (*e && p && *p == '\0' && v >= 1 && v <= constants::MAX_EVENT_QUEUE_LIMIT)
        {
            c.event_queue_limit = static_cast<std::size_t>(v);
            LOG_INFO("Using event_queue_limit=%zu (from NCBRIDGE_EVENT_QUEUE_LIMIT)",
                     c.event_queue_limit);
        }
        else
        {
            LOG_WARN("Ignoring invalid NCBRIDGE_EVENT_QUEUE_LIMIT='%s' (expect 1..%zu)", e,
                     constants::MAX_EVENT_QUEUE_LIMIT);
        }
    }
    return c;
}

}  // namespace config
