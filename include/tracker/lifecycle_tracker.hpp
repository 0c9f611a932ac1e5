#pragma once
#include <chrono>
#include <cstdint>
#include <string>

#include "events/event.hpp"
#include "provider/iprovider.hpp"

namespace tracker
{

// Republishes connection-phase callbacks for one advertise/connect session.
// Elapsed time is measured from construction, i.e. from when the operation
// was issued.
class ConnectionTracker final : public provider::ConnectionListener
{
  public:
    ConnectionTracker(std::string callback_id, events::IEventSink &sink);

    void on_connection_initiated(const std::string              &endpoint_id,
                                 const provider::ConnectionInfo &info) override;
    void on_connection_result(const std::string                    &endpoint_id,
                              const provider::ConnectionResolution &resolution) override;
    void on_disconnected(const std::string &endpoint_id) override;
    void on_bandwidth_changed(const std::string             &endpoint_id,
                              const provider::BandwidthInfo &info) override;

    const std::string &callback_id() const { return callback_id_; }

  private:
    std::int64_t elapsed_ns() const;

    std::string                           callback_id_;
    events::IEventSink                   &sink_;
    std::chrono::steady_clock::time_point start_;
};

// Same for endpoint discovery.
class DiscoveryTracker final : public provider::DiscoveryListener
{
  public:
    DiscoveryTracker(std::string callback_id, events::IEventSink &sink);

    void on_endpoint_found(const std::string                      &endpoint_id,
                           const provider::DiscoveredEndpointInfo &info) override;
    void on_endpoint_lost(const std::string &endpoint_id) override;

    const std::string &callback_id() const { return callback_id_; }

  private:
    std::string                           callback_id_;
    events::IEventSink                   &sink_;
    std::chrono::steady_clock::time_point start_;
};

}  // namespace tracker
