#pragma once
#include <memory>
#include <optional>
#include <string>

#include "provider/iprovider.hpp"

namespace provider
{

struct BluezSettings
{
    std::string adapter = "hci0";
};

// BLE-only provider on top of BlueZ. Advertising exports an LEAdvertisement1
// carrying the service UUID; discovery follows Adapter1 device objects.
// Connections and payloads are not available over this backend.
class BluezProvider final : public IConnectionsProvider
{
  public:
    explicit BluezProvider(BluezSettings cfg);
    ~BluezProvider() override;

    BluezProvider(const BluezProvider &)            = delete;
    BluezProvider &operator=(const BluezProvider &) = delete;

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
    std::string name() const override { return "bluez"; }

    // Accessors used by the sd-bus callbacks (bus thread, bus_mu held)
    const BluezSettings &config() const { return cfg_; }
    const std::string   &adv_name() const;
    const std::string   &adv_uuid() const;
    const std::string   &scan_uuid() const;
    void on_device_seen(const std::string &obj_path, const std::string &addr,
                        const std::string &alias, bool svc_hit);
    void on_device_gone(const std::string &obj_path);

  private:
    bool ensure_bus();
    void stop_bus();
    bool register_advertisement();
    void unregister_advertisement();
    bool set_discovery_filter();
    bool subscribe_device_signals();
    bool adapter_discovery(bool on);

    BluezSettings cfg_;
    std::string   local_id_;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// True when the set is unconstrained or names a Bluetooth-family medium.
bool bluetooth_usable(const std::optional<medium::MediumSet> &set);

}  // namespace provider
