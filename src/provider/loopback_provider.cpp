#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <new>
#include <system_error>

#include "provider/byte_sources.hpp"
#include "provider/loopback_provider.hpp"
#include "util/constants.hpp"
#include "util/ids.hpp"
#include "util/log.hpp"

namespace provider
{

BwQuality quality_for(medium::Medium m)
{
    using medium::Medium;
    switch (m)
    {
        case Medium::WifiLan:
        case Medium::WifiHotspot:
        case Medium::WifiDirect:
        case Medium::WifiAware:
        case Medium::WebRtc:
        case Medium::Usb:
            return BwQuality::High;
        case Medium::Bluetooth:
        case Medium::BleL2cap:
            return BwQuality::Medium;
        case Medium::Ble:
        case Medium::Nfc:
        case Medium::Mdns:
            return BwQuality::Low;
        case Medium::Unknown:
            break;
    }
    return BwQuality::Unknown;
}

LoopbackProvider::LoopbackProvider(LoopbackSettings s) : s_(std::move(s))
{
    local_id_ = s_.local_endpoint_id.empty() ? ids::new_endpoint_id() : s_.local_endpoint_id;
    if (s_.chunk_size == 0)
        s_.chunk_size = 64 * 1024;
    worker_ = std::thread([this] { run(); });
}

LoopbackProvider::~LoopbackProvider()
{
    {
        std::lock_guard<std::mutex> lk(q_mu_);
        stop_.store(true);
    }
    q_cv_.notify_all();
    idle_cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

// ---------------- worker ----------------

void LoopbackProvider::post(std::function<void()> task)
{
    {
        std::lock_guard<std::mutex> lk(q_mu_);
        queue_.push_back(std::move(task));
    }
    q_cv_.notify_one();
}

void LoopbackProvider::run()
{
    while (true)
    {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lk(q_mu_);
            q_cv_.wait(lk, [this] { return stop_.load() || !queue_.empty(); });
            if (stop_.load())
                return;
            task = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;
        }

        if (s_.step_delay.count() > 0)
            std::this_thread::sleep_for(s_.step_delay);
        task();

        {
            std::lock_guard<std::mutex> lk(q_mu_);
            busy_ = false;
        }
        idle_cv_.notify_all();
    }
}

void LoopbackProvider::flush()
{
    std::unique_lock<std::mutex> lk(q_mu_);
    idle_cv_.wait(lk, [this] { return stop_.load() || (queue_.empty() && !busy_); });
}

// ---------------- advertising / discovery ----------------

int LoopbackProvider::start_advertising(const std::string                  &name,
                                        const std::string                  &service_id,
                                        std::shared_ptr<ConnectionListener> listener,
                                        const medium::AdvertisingOptions   &opts)
{
    if (!listener)
        return status::kError;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (advertising_)
            return status::kAlreadyAdvertising;
        advertising_ = true;
    }
    LOG_INFO("[LOOPBACK] advertising '%s' service=%s mediums=%s upgrade=%s", name.c_str(),
             service_id.c_str(), medium::medium_set_str(opts.advertising_mediums).c_str(),
             medium::medium_set_str(opts.upgrade_mediums).c_str());

    // The simulated peer notices us and dials in.
    const auto upgrade = opts.upgrade_mediums;
    post([this, listener, upgrade] {
        const std::string &peer = s_.peer_endpoint_id;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!advertising_ || conns_.count(peer))
                return;
            conns_[peer] = Connection{listener, nullptr, upgrade, false};
        }
        listener->on_connection_initiated(peer,
                                          ConnectionInfo{s_.peer_name, ids::new_endpoint_id(), true});
    });
    return status::kSuccess;
}

int LoopbackProvider::stop_advertising()
{
    std::lock_guard<std::mutex> lk(mu_);
    advertising_ = false;
    return status::kSuccess;
}

int LoopbackProvider::start_discovery(const std::string                 &service_id,
                                      std::shared_ptr<DiscoveryListener> listener,
                                      const medium::DiscoveryOptions    &opts)
{
    if (!listener)
        return status::kError;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (discovering_)
            return status::kAlreadyDiscovering;
        discovering_   = true;
        disc_listener_ = listener;
    }
    LOG_INFO("[LOOPBACK] discovering service=%s mediums=%s", service_id.c_str(),
             medium::medium_set_str(opts.discovery_mediums).c_str());

    post([this, listener, service_id] {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!discovering_)
                return;
            peer_discovered_ = true;
        }
        listener->on_endpoint_found(s_.peer_endpoint_id,
                                    DiscoveredEndpointInfo{s_.peer_name, service_id});
    });
    return status::kSuccess;
}

int LoopbackProvider::stop_discovery()
{
    std::lock_guard<std::mutex> lk(mu_);
    discovering_ = false;
    disc_listener_.reset();
    return status::kSuccess;
}

// ---------------- connections ----------------

int LoopbackProvider::request_connection(const std::string                  &name,
                                         const std::string                  &endpoint_id,
                                         std::shared_ptr<ConnectionListener> listener,
                                         const medium::ConnectionOptions    &opts)
{
    if (!listener)
        return status::kError;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (endpoint_id != s_.peer_endpoint_id || !peer_discovered_)
            return status::kEndpointUnknown;
        if (conns_.count(endpoint_id))
            return status::kAlreadyConnectedToEndpoint;
        conns_[endpoint_id] = Connection{listener, nullptr, opts.upgrade_mediums, false};
    }
    LOG_INFO("[LOOPBACK] '%s' requests %s via %s, upgrade=%s", name.c_str(), endpoint_id.c_str(),
             medium::medium_set_str(opts.connection_mediums).c_str(),
             medium::medium_set_str(opts.upgrade_mediums).c_str());

    post([this, listener, endpoint_id] {
        listener->on_connection_initiated(
            endpoint_id, ConnectionInfo{s_.peer_name, ids::new_endpoint_id(), false});
    });
    return status::kSuccess;
}

int LoopbackProvider::accept_connection(const std::string               &endpoint_id,
                                        std::shared_ptr<PayloadListener> listener)
{
    if (!listener)
        return status::kError;

    std::shared_ptr<ConnectionListener> conn_listener;
    medium::Medium                      upgraded = medium::Medium::WifiLan;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = conns_.find(endpoint_id);
        if (it == conns_.end())
            return status::kEndpointUnknown;
        if (it->second.accepted)
            return status::kAlreadyConnectedToEndpoint;
        it->second.accepted         = true;
        it->second.payload_listener = listener;
        conn_listener               = it->second.listener;
        if (it->second.upgrade_mediums && !it->second.upgrade_mediums->empty())
            upgraded = it->second.upgrade_mediums->front();
    }

    post([conn_listener, endpoint_id, upgraded] {
        conn_listener->on_connection_result(endpoint_id, ConnectionResolution{status::kSuccess});
        conn_listener->on_bandwidth_changed(
            endpoint_id, BandwidthInfo{UpgradeStatus::Upgraded, quality_for(upgraded), upgraded});
    });
    return status::kSuccess;
}

int LoopbackProvider::disconnect_from_endpoint(const std::string &endpoint_id)
{
    std::lock_guard<std::mutex> lk(mu_);
    if (conns_.erase(endpoint_id) == 0)
        return status::kNotConnectedToEndpoint;
    LOG_INFO("[LOOPBACK] disconnected from %s", endpoint_id.c_str());
    return status::kSuccess;
}

void LoopbackProvider::stop_all_endpoints()
{
    std::lock_guard<std::mutex> lk(mu_);
    advertising_     = false;
    discovering_     = false;
    peer_discovered_ = false;
    disc_listener_.reset();
    conns_.clear();
}

void LoopbackProvider::drop_peer()
{
    std::shared_ptr<DiscoveryListener>               disc;
    std::vector<std::shared_ptr<ConnectionListener>> lost;
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (peer_discovered_)
            disc = disc_listener_;
        peer_discovered_ = false;
        auto it          = conns_.find(s_.peer_endpoint_id);
        if (it != conns_.end())
        {
            lost.push_back(it->second.listener);
            conns_.erase(it);
        }
    }

    const std::string peer = s_.peer_endpoint_id;
    post([disc, lost, peer] {
        for (const auto &l : lost)
            l->on_disconnected(peer);
        if (disc)
            disc->on_endpoint_lost(peer);
    });
}

// ---------------- payloads ----------------

int LoopbackProvider::send_payload(const std::string &endpoint_id, Payload payload)
{
    std::shared_ptr<PayloadListener> listener;
    {
        std::lock_guard<std::mutex> lk(mu_);
        auto                        it = conns_.find(endpoint_id);
        if (it == conns_.end() || !it->second.accepted)
            return status::kNotConnectedToEndpoint;
        listener = it->second.payload_listener;
    }
    if (payload.kind == PayloadKind::File && !std::filesystem::exists(payload.file_path))
        return status::kPayloadIoError;
    if (payload.kind == PayloadKind::Stream && !payload.stream)
        return status::kPayloadIoError;

    post([this, endpoint_id, payload, listener] {
        deliver_outgoing(endpoint_id, payload, listener);
    });
    return status::kSuccess;
}

void LoopbackProvider::report_progress(
    const std::string &endpoint_id, std::int64_t payload_id, std::int64_t total,
    const std::shared_ptr<PayloadListener>                &listener,
    const std::function<void(std::size_t, std::size_t)> &on_chunk)
{
    const auto size = static_cast<std::size_t>(total);
    for (std::size_t off = 0; off < size; off += s_.chunk_size)
    {
        const std::size_t n = std::min(s_.chunk_size, size - off);
        if (on_chunk)
            on_chunk(off, n);
        listener->on_payload_transfer_update(
            endpoint_id, PayloadTransferUpdate{payload_id, TransferStatus::InProgress,
                                               static_cast<std::int64_t>(off + n), total});
    }
}

void LoopbackProvider::deliver_outgoing(const std::string &endpoint_id, Payload payload,
                                        std::shared_ptr<PayloadListener> listener)
{
    std::vector<std::uint8_t> content;
    bool                      ok = true;

    try
    {
        switch (payload.kind)
        {
            case PayloadKind::Bytes:
                content = payload.bytes;
                break;
            case PayloadKind::File:
            {
                std::ifstream in(payload.file_path, std::ios::binary);
                if (!in)
                {
                    LOG_ERROR("[LOOPBACK] cannot open %s", payload.file_path.c_str());
                    ok = false;
                    break;
                }
                content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
                break;
            }
            case PayloadKind::Stream:
            {
                std::uint8_t buf[8192];
                while (true)
                {
                    const long n = payload.stream->read(buf, sizeof(buf));
                    if (n < 0)
                    {
                        ok = false;
                        break;
                    }
                    if (n == 0)
                        break;
                    content.insert(content.end(), buf, buf + n);
                }
                if (!payload.stream->close())
                    LOG_WARN("[LOOPBACK] closing outgoing stream %lld failed", (long long)payload.id);
                break;
            }
        }
    }
    catch (const std::bad_alloc &)
    {
        LOG_ERROR("[LOOPBACK] payload %lld does not fit in memory (%lld bytes)",
                  (long long)payload.id, (long long)payload.size);
        content.clear();
        content.shrink_to_fit();
        if (payload.kind == PayloadKind::Stream && !payload.stream->close())
            LOG_WARN("[LOOPBACK] closing outgoing stream %lld failed", (long long)payload.id);
        ok = false;
    }

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (!conns_.count(endpoint_id))
            ok = false;
    }

    const auto total = ok ? static_cast<std::int64_t>(content.size()) : payload.size;
    if (!ok)
    {
        listener->on_payload_transfer_update(
            endpoint_id, PayloadTransferUpdate{payload.id, TransferStatus::Failure, 0, total});
        return;
    }

    report_progress(endpoint_id, payload.id, total, listener, nullptr);
    listener->on_payload_transfer_update(
        endpoint_id, PayloadTransferUpdate{payload.id, TransferStatus::Success, total, total});

    if (s_.echo_payloads)
        echo_incoming(endpoint_id, content, payload.kind, listener);
}

void LoopbackProvider::echo_incoming(const std::string                     &endpoint_id,
                                     const std::vector<std::uint8_t>       &content,
                                     PayloadKind                            kind,
                                     const std::shared_ptr<PayloadListener> &listener)
{
    Payload in;
    in.id   = ids::new_payload_id();
    in.kind = kind;
    in.size = static_cast<std::int64_t>(content.size());

    std::shared_ptr<BufferByteSource> buf;
    bool                              written = true;
    switch (kind)
    {
        case PayloadKind::Bytes:
            in.bytes = content;
            break;
        case PayloadKind::File:
        {
            namespace fs = std::filesystem;
            std::error_code ec;
            fs::path        dir = s_.receive_dir.empty() ? fs::temp_directory_path(ec)
                                                         : fs::path(s_.receive_dir);
            fs::create_directories(dir, ec);
            in.file_path = (dir / (std::string(constants::RECEIVED_FILE_PREFIX) +
                                   std::to_string(in.id)))
                               .string();
            std::ofstream out(in.file_path, std::ios::binary | std::ios::trunc);
            out.write(reinterpret_cast<const char *>(content.data()),
                      static_cast<std::streamsize>(content.size()));
            if (!out)
            {
                LOG_ERROR("[LOOPBACK] cannot write %s", in.file_path.c_str());
                written = false;
            }
            break;
        }
        case PayloadKind::Stream:
            buf       = std::make_shared<BufferByteSource>();
            in.stream = buf;
            break;
    }

    listener->on_payload_received(endpoint_id, in);
    if (!written)
    {
        listener->on_payload_transfer_update(
            endpoint_id, PayloadTransferUpdate{in.id, TransferStatus::Failure, 0, in.size});
        return;
    }

    report_progress(endpoint_id, in.id, in.size, listener,
                    [&](std::size_t off, std::size_t n) {
                        if (buf)
                            buf->append(content.data() + off, n);
                    });
    if (buf)
        buf->finish();
    listener->on_payload_transfer_update(
        endpoint_id, PayloadTransferUpdate{in.id, TransferStatus::Success, in.size, in.size});
}

}  // namespace provider
