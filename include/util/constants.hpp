#pragma once
#include <cstddef>
#include <cstdlib>
#include <string>
#include <string_view>

namespace constants
{
// Sender-side payload files are named <prefix><name><index>
inline constexpr std::string_view SENDER_FILE_PREFIX = "nearby_test_";
// Incoming payload files written by providers that buffer to disk
inline constexpr std::string_view RECEIVED_FILE_PREFIX = "nearby_rx_";

inline constexpr std::size_t DEFAULT_EVENT_QUEUE_LIMIT = 1024;
inline constexpr std::size_t MAX_EVENT_QUEUE_LIMIT     = 65536;

// Longest EVENT_WAIT the daemon honours; larger requests are cut to this
inline constexpr long long MAX_EVENT_WAIT_MS = 24LL * 60 * 60 * 1000;

// Stream payloads are drained in slices of this size
inline constexpr std::size_t STREAM_DRAIN_SLICE = 64 * 1024;

// $HOME/.cache/ncbridge, or /tmp/.cache/ncbridge when HOME is unset
inline std::string cache_dir()
{
    const char *home = std::getenv("HOME");
    return std::string(home && *home ? home : "/tmp") + "/.cache/ncbridge";
}

inline std::string env_or(const char *name, const std::string &fallback)
{
    const char *value = std::getenv(name);
    return value && *value ? std::string(value) : fallback;
}

// Control socket path (Unix domain socket)
inline std::string ctl_sock_path()
{
    return env_or("NCBRIDGE_CTL_SOCK", cache_dir() + "/ctl.sock");
}

// Where sender-side payload files and received files are kept
inline std::string payload_dir()
{
    return env_or("NCBRIDGE_PAYLOAD_DIR", cache_dir() + "/payloads");
}

}  // namespace constants
