#include <chrono>

#include "tracker/lifecycle_tracker.hpp"
#include "util/log.hpp"

namespace tracker
{

namespace
{
std::int64_t ns_since(std::chrono::steady_clock::time_point start)
{
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now() - start).count();
}
}  // namespace

// ---------------- ConnectionTracker ----------------

ConnectionTracker::ConnectionTracker(std::string callback_id, events::IEventSink &sink)
    : callback_id_(std::move(callback_id)), sink_(sink), start_(std::chrono::steady_clock::now())
{
}

std::int64_t ConnectionTracker::elapsed_ns() const
{
    return ns_since(start_);
}

void ConnectionTracker::on_connection_initiated(const std::string              &endpoint_id,
                                                const provider::ConnectionInfo &info)
{
    events::ConnectionInitiated ev;
    ev.endpoint_id           = endpoint_id;
    ev.connection_time_ns    = elapsed_ns();
    ev.endpoint_name         = info.endpoint_name;
    ev.authentication_digits = info.authentication_digits;
    ev.is_incoming           = info.is_incoming;

    LOG_SYSTEM("[CONN] initiated %s (%s) after %lld ns, %s", endpoint_id.c_str(),
               info.endpoint_name.c_str(), (long long)ev.connection_time_ns,
               info.is_incoming ? "incoming" : "outgoing");
    sink_.post(events::make_event(callback_id_, std::move(ev)));
}

void ConnectionTracker::on_connection_result(const std::string                    &endpoint_id,
                                             const provider::ConnectionResolution &resolution)
{
    events::ConnectionResult ev;
    ev.endpoint_id = endpoint_id;
    ev.status_code = resolution.status_code;
    ev.is_success  = resolution.is_success();

    LOG_SYSTEM("[CONN] result %s: %s (%d)", endpoint_id.c_str(),
               provider::status_name(resolution.status_code), resolution.status_code);
    sink_.post(events::make_event(callback_id_, std::move(ev)));
}

void ConnectionTracker::on_disconnected(const std::string &endpoint_id)
{
    LOG_SYSTEM("[CONN] disconnected %s", endpoint_id.c_str());
    sink_.post(events::make_event(callback_id_, events::Disconnected{endpoint_id}));
}

void ConnectionTracker::on_bandwidth_changed(const std::string             &endpoint_id,
                                             const provider::BandwidthInfo &info)
{
    events::BandwidthChanged ev;
    ev.endpoint_id     = endpoint_id;
    ev.upgrade_status  = static_cast<int>(info.upgrade_status);
    ev.quality         = static_cast<int>(info.quality);
    ev.is_high_quality = info.quality == provider::BwQuality::High;
    ev.medium          = static_cast<int>(info.medium);

    LOG_SYSTEM("[CONN] bandwidth changed %s: medium=%s quality=%d", endpoint_id.c_str(),
               medium::medium_name(info.medium), ev.quality);
    sink_.post(events::make_event(callback_id_, std::move(ev)));
}

// ---------------- DiscoveryTracker ----------------

DiscoveryTracker::DiscoveryTracker(std::string callback_id, events::IEventSink &sink)
    : callback_id_(std::move(callback_id)), sink_(sink), start_(std::chrono::steady_clock::now())
{
}

void DiscoveryTracker::on_endpoint_found(const std::string                      &endpoint_id,
                                         const provider::DiscoveredEndpointInfo &info)
{
    events::EndpointFound ev;
    ev.endpoint_id       = endpoint_id;
    ev.discovery_time_ns = ns_since(start_);
    ev.endpoint_name     = info.endpoint_name;
    ev.service_id        = info.service_id;

    LOG_SYSTEM("[DISC] found %s (%s) after %lld ns", endpoint_id.c_str(),
               info.endpoint_name.c_str(), (long long)ev.discovery_time_ns);
    sink_.post(events::make_event(callback_id_, std::move(ev)));
}

void DiscoveryTracker::on_endpoint_lost(const std::string &endpoint_id)
{
    LOG_SYSTEM("[DISC] lost %s", endpoint_id.c_str());
    sink_.post(events::make_event(callback_id_, events::EndpointLost{endpoint_id}));
}

}  // namespace tracker
