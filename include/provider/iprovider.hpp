#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "medium/medium_settings.hpp"

namespace provider
{

// Operation status codes returned by providers (0 == success).
namespace status
{
constexpr int kSuccess                   = 0;
constexpr int kError                     = 13;
constexpr int kAlreadyAdvertising        = 8001;
constexpr int kAlreadyDiscovering        = 8002;
constexpr int kAlreadyConnectedToEndpoint = 8003;
constexpr int kConnectionRejected        = 8004;
constexpr int kNotConnectedToEndpoint    = 8005;
constexpr int kEndpointUnknown           = 8011;
constexpr int kEndpointIoError           = 8012;
constexpr int kPayloadIoError            = 8013;
constexpr int kUnsupportedMedium         = 8034;
}  // namespace status

const char *status_name(int code);

enum class PayloadKind : int
{
    Bytes  = 1,
    File   = 2,
    Stream = 3,
};

enum class TransferStatus : int
{
    Success    = 1,
    Failure    = 2,
    InProgress = 3,
    Canceled   = 4,
};

enum class BwQuality : int
{
    Unknown = 0,
    Low     = 1,
    Medium  = 2,
    High    = 3,
};

enum class UpgradeStatus : int
{
    Unknown  = 0,
    Upgraded = 1,
    Failed   = 2,
};

// Incrementally produced bytes of a stream payload.
struct ByteSource
{
    // >0: bytes copied, 0: nothing available right now / end, -1: I/O error
    virtual long read(std::uint8_t *buf, std::size_t n) = 0;
    virtual bool close()                                 = 0;
    virtual ~ByteSource()                                = default;
};

struct Payload
{
    std::int64_t                id{0};
    PayloadKind                 kind{PayloadKind::Bytes};
    std::string                 file_path;  // File
    std::vector<std::uint8_t>   bytes;      // Bytes
    std::shared_ptr<ByteSource> stream;     // Stream
    std::int64_t                size{0};
};

struct ConnectionInfo
{
    std::string endpoint_name;
    std::string authentication_digits;
    bool        is_incoming{false};
};

struct ConnectionResolution
{
    int  status_code{status::kSuccess};
    bool is_success() const { return status_code == status::kSuccess; }
};

struct BandwidthInfo
{
    UpgradeStatus  upgrade_status{UpgradeStatus::Unknown};
    BwQuality      quality{BwQuality::Unknown};
    medium::Medium medium{medium::Medium::Unknown};
};

struct DiscoveredEndpointInfo
{
    std::string endpoint_name;
    std::string service_id;
};

struct PayloadTransferUpdate
{
    std::int64_t   payload_id{0};
    TransferStatus status{TransferStatus::InProgress};
    std::int64_t   bytes_transferred{0};
    std::int64_t   total_bytes{0};
};

// ---- Listeners; invoked on provider-owned threads ----
struct ConnectionListener
{
    virtual void on_connection_initiated(const std::string    &endpoint_id,
                                         const ConnectionInfo &info)                 = 0;
    virtual void on_connection_result(const std::string          &endpoint_id,
                                      const ConnectionResolution &resolution)        = 0;
    virtual void on_disconnected(const std::string &endpoint_id)                     = 0;
    virtual void on_bandwidth_changed(const std::string   &endpoint_id,
                                      const BandwidthInfo &info)                     = 0;
    virtual ~ConnectionListener() = default;
};

struct DiscoveryListener
{
    virtual void on_endpoint_found(const std::string            &endpoint_id,
                                   const DiscoveredEndpointInfo &info) = 0;
    virtual void on_endpoint_lost(const std::string &endpoint_id)      = 0;
    virtual ~DiscoveryListener() = default;
};

struct PayloadListener
{
    virtual void on_payload_received(const std::string &endpoint_id, const Payload &payload) = 0;
    virtual void on_payload_transfer_update(const std::string           &endpoint_id,
                                            const PayloadTransferUpdate &update)             = 0;
    virtual ~PayloadListener() = default;
};

// The connectivity service. Listener handles are kept for as long as the
// provider may call them; dropping them ends the session.
struct IConnectionsProvider
{
    virtual int start_advertising(const std::string                  &name,
                                  const std::string                  &service_id,
                                  std::shared_ptr<ConnectionListener> listener,
                                  const medium::AdvertisingOptions   &opts)      = 0;
    virtual int stop_advertising()                                               = 0;
    virtual int start_discovery(const std::string                 &service_id,
                                std::shared_ptr<DiscoveryListener> listener,
                                const medium::DiscoveryOptions    &opts)         = 0;
    virtual int stop_discovery()                                                 = 0;
    virtual int request_connection(const std::string                  &name,
                                   const std::string                  &endpoint_id,
                                   std::shared_ptr<ConnectionListener> listener,
                                   const medium::ConnectionOptions    &opts)     = 0;
    virtual int accept_connection(const std::string              &endpoint_id,
                                  std::shared_ptr<PayloadListener> listener)     = 0;
    virtual int disconnect_from_endpoint(const std::string &endpoint_id)         = 0;
    virtual int send_payload(const std::string &endpoint_id, Payload payload)    = 0;
    virtual void        stop_all_endpoints()                                     = 0;
    virtual std::string local_endpoint_id() const                                = 0;
    virtual std::string name() const { return ""; }
    virtual ~IConnectionsProvider() = default;
};

}  // namespace provider
