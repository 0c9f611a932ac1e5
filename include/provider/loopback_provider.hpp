#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "provider/iprovider.hpp"

namespace provider
{

struct LoopbackSettings
{
    std::string               local_endpoint_id;  // empty: random
    std::string               peer_endpoint_id = "PEER";
    std::string               peer_name        = "loopback-peer";
    std::string               receive_dir;  // where echoed file payloads land
    std::size_t               chunk_size = 64 * 1024;
    std::chrono::milliseconds step_delay{1};
    bool                      echo_payloads = true;
};

// A fake connectivity service with one simulated peer. Every listener callback
// is delivered from a provider-owned worker thread, in submission order.
class LoopbackProvider final : public IConnectionsProvider
{
  public:
    explicit LoopbackProvider(LoopbackSettings s = {});
    ~LoopbackProvider() override;

    LoopbackProvider(const LoopbackProvider &)            = delete;
    LoopbackProvider &operator=(const LoopbackProvider &) = delete;

    int  start_advertising(const std::string                  &name,
                           const std::string                  &service_id,
                           std::shared_ptr<ConnectionListener> listener,
                           const medium::AdvertisingOptions   &opts) override;
    int  stop_advertising() override;
    int  start_discovery(const std::string                 &service_id,
                         std::shared_ptr<DiscoveryListener> listener,
                         const medium::DiscoveryOptions    &opts) override;
    int  stop_discovery() override;
    int  request_connection(const std::string                  &name,
                            const std::string                  &endpoint_id,
                            std::shared_ptr<ConnectionListener> listener,
                            const medium::ConnectionOptions    &opts) override;
    int  accept_connection(const std::string               &endpoint_id,
                           std::shared_ptr<PayloadListener> listener) override;
    int  disconnect_from_endpoint(const std::string &endpoint_id) override;
    int  send_payload(const std::string &endpoint_id, Payload payload) override;
    void stop_all_endpoints() override;

    std::string local_endpoint_id() const override { return local_id_; }
    std::string name() const override { return "loopback"; }

    // Simulates the peer going out of range: discovery reports it lost and
    // every connection to it reports a remote disconnect.
    void drop_peer();

    // Blocks until every queued callback has been delivered. Must not be
    // called from a listener.
    void flush();

  private:
    struct Connection
    {
        std::shared_ptr<ConnectionListener> listener;
        std::shared_ptr<PayloadListener>    payload_listener;
        std::optional<medium::MediumSet>    upgrade_mediums;
        bool                                accepted{false};
    };

    void post(std::function<void()> task);
    void run();

    void deliver_outgoing(const std::string &endpoint_id, Payload payload,
                          std::shared_ptr<PayloadListener> listener);
    void echo_incoming(const std::string &endpoint_id, const std::vector<std::uint8_t> &content,
                       PayloadKind kind, const std::shared_ptr<PayloadListener> &listener);
    void report_progress(const std::string &endpoint_id, std::int64_t payload_id,
                         std::int64_t total, const std::shared_ptr<PayloadListener> &listener,
                         const std::function<void(std::size_t, std::size_t)> &on_chunk);

    LoopbackSettings s_;
    std::string      local_id_;

    mutable std::mutex                  mu_;
    bool                                advertising_{false};
    bool                                discovering_{false};
    bool                                peer_discovered_{false};
    std::shared_ptr<DiscoveryListener>  disc_listener_;
    std::map<std::string, Connection>   conns_;

    std::mutex                        q_mu_;
    std::condition_variable           q_cv_;
    std::condition_variable           idle_cv_;
    std::deque<std::function<void()>> queue_;
    bool                              busy_{false};
    std::atomic_bool                  stop_{false};
    std::thread                       worker_;
};

// Quality the simulated link reports after upgrading to m.
BwQuality quality_for(medium::Medium m);

}  // namespace provider
