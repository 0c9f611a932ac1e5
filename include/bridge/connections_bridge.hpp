#pragma once
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "events/event.hpp"
#include "provider/iprovider.hpp"
#include "tracker/lifecycle_tracker.hpp"
#include "tracker/payload_tracker.hpp"

namespace bridge
{

// Driver-facing operations. Each call resolves the requested mediums, hands a
// fresh tracker to the provider and returns once the provider accepted the
// request; everything after that arrives as events on the sink.
//
// Errors: ncbridge::BridgeError (InvalidArgument for bad selectors/arguments,
// ProviderCallFailure for a non-zero provider status).
class ConnectionsBridge
{
  public:
    ConnectionsBridge(provider::IConnectionsProvider &provider,
                      events::IEventSink             &sink,
                      std::string                     payload_dir);

    std::string local_endpoint_id() const;

    void start_advertising(const std::string &callback_id,
                           const std::string &name,
                           const std::string &service_id,
                           int                advertise_selector,
                           int                upgrade_selector);
    void stop_advertising();

    void start_discovery(const std::string &callback_id,
                         const std::string &service_id,
                         int                discover_selector);
    void stop_discovery();

    void request_connection(const std::string &callback_id,
                            const std::string &name,
                            const std::string &endpoint_id,
                            int                connect_selector,
                            int                upgrade_selector,
                            int                upgrade_type,
                            std::int32_t       keep_alive_timeout_ms,
                            std::int32_t       keep_alive_interval_ms);

    // Registers the payload tracker for this endpoint's session.
    void accept_connection(const std::string &callback_id, const std::string &endpoint_id);
    void disconnect_from_endpoint(const std::string &endpoint_id);

    // Sends `count` payloads of size_kb KiB each; returns the id of the last one.
    std::int64_t send_payload(const std::string &endpoint_id,
                              const std::string &name,
                              std::int64_t       size_kb,
                              int                kind  = static_cast<int>(provider::PayloadKind::File),
                              int                count = 1);

    void stop_all_endpoints();

    // Deletes every sender-side file created by send_payload.
    void transfer_files_cleanup();

    const std::string &payload_dir() const { return payload_dir_; }
    std::shared_ptr<tracker::PayloadTracker> payload_tracker(const std::string &endpoint_id) const;

  private:
    void check(int status, const char *op) const;
    std::string create_sender_file(const std::string &name, std::int64_t size_bytes) const;

    provider::IConnectionsProvider &provider_;
    events::IEventSink             &sink_;
    std::string                     payload_dir_;
    tracker::FilePayloadStore       store_;

    mutable std::mutex                                              mu_;
    std::map<std::string, std::shared_ptr<tracker::PayloadTracker>> payload_trackers_;
};

}  // namespace bridge
