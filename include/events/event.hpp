#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace events
{

// ---- Payloads, one per driver-visible event name ----
struct ConnectionInitiated
{
    std::string  endpoint_id;
    std::int64_t connection_time_ns{0};
    std::string  endpoint_name;
    std::string  authentication_digits;
    bool         is_incoming{false};
};

struct ConnectionResult
{
    std::string endpoint_id;
    int         status_code{0};
    bool        is_success{false};
};

struct Disconnected
{
    std::string endpoint_id;
};

struct BandwidthChanged
{
    std::string endpoint_id;
    int         upgrade_status{0};
    int         quality{0};
    bool        is_high_quality{false};
    int         medium{0};
};

struct EndpointFound
{
    std::string  endpoint_id;
    std::int64_t discovery_time_ns{0};
    std::string  endpoint_name;
    std::string  service_id;
};

struct EndpointLost
{
    std::string endpoint_id;
};

struct PayloadReceived
{
    std::string  endpoint_id;
    std::int64_t payload_id{0};
    std::string  payload_type;  // BYTES | FILE | STREAM | UNKNOWN
};

struct PayloadTransferUpdate
{
    std::string                 endpoint_id;
    std::int64_t                payload_id{0};
    std::int64_t                bytes_transferred{0};
    std::int64_t                total_bytes{0};
    int                         status_code{0};
    bool                        is_success{false};
    std::optional<std::int64_t> transfer_time_ns;  // only while the transfer stopwatch runs
};

// Posted when an async operation (advertising) was accepted by the provider
struct AsyncSuccess
{
};

using Payload = std::variant<ConnectionInitiated,
                             ConnectionResult,
                             Disconnected,
                             BandwidthChanged,
                             EndpointFound,
                             EndpointLost,
                             PayloadReceived,
                             PayloadTransferUpdate,
                             AsyncSuccess>;

struct Event
{
    std::string  callback_id;
    std::int64_t creation_time_ms{0};
    Payload      payload;
};

using FieldValue = std::variant<std::string, std::int64_t, bool>;
using Fields     = std::vector<std::pair<std::string, FieldValue>>;

Event       make_event(std::string callback_id, Payload payload);
const char *event_name(const Event &ev);
Fields      event_fields(const Event &ev);

// "EVENT <callback_id> <name> <creation_time_ms> key=value ..."
std::string encode_event_line(const Event &ev);

// Percent-escape so a token never carries ' ', '%', '=' or line breaks.
std::string escape_token(const std::string &in);
std::string unescape_token(const std::string &in);

// Fan-out sink all trackers publish through.
struct IEventSink
{
    virtual void post(Event ev) = 0;
    virtual ~IEventSink()       = default;
};

}  // namespace events
