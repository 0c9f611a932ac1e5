#include <chrono>
#include <cstdio>
#include <string>
#include <type_traits>

#include "events/event.hpp"

namespace events
{

namespace
{
template <class... Ts>
struct overloaded : Ts...
{
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::int64_t now_ms()
{
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

int hex_val(char c)
{
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return 10 + (c - 'a');
    if (c >= 'A' && c <= 'F')
        return 10 + (c - 'A');
    return -1;
}
}  // namespace

Event make_event(std::string callback_id, Payload payload)
{
    Event ev;
    ev.callback_id      = std::move(callback_id);
    ev.creation_time_ms = now_ms();
    ev.payload          = std::move(payload);
    return ev;
}

const char *event_name(const Event &ev)
{
    return std::visit(overloaded{
                          [](const ConnectionInitiated &) { return "onConnectionInitiated"; },
                          [](const ConnectionResult &) { return "onConnectionResult"; },
                          [](const Disconnected &) { return "onDisconnected"; },
                          [](const BandwidthChanged &) { return "onBandwidthChanged"; },
                          [](const EndpointFound &) { return "onEndpointFound"; },
                          [](const EndpointLost &) { return "onEndpointLost"; },
                          [](const PayloadReceived &) { return "onPayloadReceived"; },
                          [](const PayloadTransferUpdate &) { return "onPayloadTransferUpdate"; },
                          [](const AsyncSuccess &) { return "onSuccess"; },
                      },
                      ev.payload);
}

Fields event_fields(const Event &ev)
{
    using I64 = std::int64_t;
    return std::visit(
        overloaded{
            [](const ConnectionInitiated &p) -> Fields {
                return {{"endpointId", p.endpoint_id},
                        {"connectionTimeNs", I64{p.connection_time_ns}},
                        {"endpointName", p.endpoint_name},
                        {"authenticationDigits", p.authentication_digits},
                        {"isIncomingConnection", p.is_incoming}};
            },
            [](const ConnectionResult &p) -> Fields {
                return {{"endpointId", p.endpoint_id},
                        {"statusCode", I64{p.status_code}},
                        {"isSuccess", p.is_success}};
            },
            [](const Disconnected &p) -> Fields { return {{"endpointId", p.endpoint_id}}; },
            [](const BandwidthChanged &p) -> Fields {
                return {{"endpointId", p.endpoint_id},
                        {"upgradeStatus", I64{p.upgrade_status}},
                        {"bwQuality", I64{p.quality}},
                        {"isHighBwQuality", p.is_high_quality},
                        {"medium", I64{p.medium}}};
            },
            [](const EndpointFound &p) -> Fields {
                return {{"endpointId", p.endpoint_id},
                        {"discoveryTimeNs", I64{p.discovery_time_ns}},
                        {"endpointName", p.endpoint_name},
                        {"serviceId", p.service_id}};
            },
            [](const EndpointLost &p) -> Fields { return {{"endpointId", p.endpoint_id}}; },
            [](const PayloadReceived &p) -> Fields {
                return {{"endpointId", p.endpoint_id},
                        {"payloadId", I64{p.payload_id}},
                        {"payloadType", p.payload_type}};
            },
            [](const PayloadTransferUpdate &p) -> Fields {
                Fields f = {{"endpointId", p.endpoint_id},
                            {"payloadId", I64{p.payload_id}},
                            {"bytesTransferred", I64{p.bytes_transferred}},
                            {"totalBytes", I64{p.total_bytes}},
                            {"statusCode", I64{p.status_code}},
                            {"isSuccess", p.is_success}};
                if (p.transfer_time_ns)
                    f.emplace_back("transferTimeNs", I64{*p.transfer_time_ns});
                return f;
            },
            [](const AsyncSuccess &) -> Fields { return {}; },
        },
        ev.payload);
}

std::string escape_token(const std::string &in)
{
    std::string out;
    out.reserve(in.size());
    for (unsigned char c : in)
    {
        if (c <= 0x20 || c == '%' || c == '=' || c == 0x7f)
        {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", (unsigned)c);
            out += buf;
        }
        else
        {
            out.push_back(static_cast<char>(c));
        }
    }
    return out;
}

std::string unescape_token(const std::string &in)
{
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i)
    {
        if (in[i] == '%' && i + 2 < in.size())
        {
            int hi = hex_val(in[i + 1]);
            int lo = hex_val(in[i + 2]);
            if (hi >= 0 && lo >= 0)
            {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(in[i]);
    }
    return out;
}

std::string encode_event_line(const Event &ev)
{
    std::string line = "EVENT ";
    line += escape_token(ev.callback_id);
    line += ' ';
    line += event_name(ev);
    line += ' ';
    line += std::to_string(ev.creation_time_ms);

    for (const auto &[key, value] : event_fields(ev))
    {
        line += ' ';
        line += key;
        line += '=';
        std::visit(
            [&line](const auto &v) {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::string>)
                    line += escape_token(v);
                else if constexpr (std::is_same_v<T, bool>)
                    line += v ? "true" : "false";
                else
                    line += std::to_string(v);
            },
            value);
    }
    return line;
}

}  // namespace events
