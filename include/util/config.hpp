#pragma once
#include <cstddef>
#include <string>

#include "util/constants.hpp"

namespace config
{

enum class ProviderKind
{
    Loopback,
    Bluez,
};

struct Config
{
    std::string  log_level = "INFO";
    ProviderKind provider  = ProviderKind::Loopback;
    std::string  adapter   = "hci0";
    std::string  ctl_sock;     // expanded
    std::string  payload_dir;  // expanded
    std::size_t  event_queue_limit = constants::DEFAULT_EVENT_QUEUE_LIMIT;
};

// NCBRIDGE_LOG_LEVEL, NCBRIDGE_PROVIDER, NCBRIDGE_ADAPTER, NCBRIDGE_CTL_SOCK,
// NCBRIDGE_PAYLOAD_DIR, NCBRIDGE_EVENT_QUEUE_LIMIT. Invalid values are logged
// and replaced by the default.
Config load_from_env();

const char *provider_kind_name(ProviderKind kind);

}  // namespace config
