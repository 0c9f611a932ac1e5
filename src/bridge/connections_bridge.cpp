#include <filesystem>
#include <fstream>
#include <limits>
#include <system_error>

#include "bridge/connections_bridge.hpp"
#include "medium/medium_settings.hpp"
#include "provider/byte_sources.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"
#include "util/ids.hpp"
#include "util/log.hpp"

namespace bridge
{

namespace fs = std::filesystem;
using ncbridge::BridgeError;
using ncbridge::ErrorKind;

ConnectionsBridge::ConnectionsBridge(provider::IConnectionsProvider &provider,
                                     events::IEventSink             &sink,
                                     std::string                     payload_dir)
    : provider_(provider), sink_(sink), payload_dir_(std::move(payload_dir))
{
}

void ConnectionsBridge::check(int status, const char *op) const
{
    if (status == provider::status::kSuccess)
        return;
    LOG_ERROR("%s rejected by %s provider: %s (%d)", op, provider_.name().c_str(),
              provider::status_name(status), status);
    throw BridgeError(ErrorKind::ProviderCallFailure, std::string(op) + " failed: " +
                                                          provider::status_name(status) + " (" +
                                                          std::to_string(status) + ")");
}

std::string ConnectionsBridge::local_endpoint_id() const
{
    return provider_.local_endpoint_id();
}

// ---------------- advertising / discovery ----------------

void ConnectionsBridge::start_advertising(const std::string &callback_id,
                                          const std::string &name,
                                          const std::string &service_id,
                                          int                advertise_selector,
                                          int                upgrade_selector)
{
    const auto opts =
        medium::advertising_options(static_cast<medium::MediumSelector>(advertise_selector),
                                    static_cast<medium::MediumSelector>(upgrade_selector));
    LOG_INFO("startAdvertising '%s' service=%s mediums=%s upgrade=%s auto_upgrade=%d low_power=%d",
             name.c_str(), service_id.c_str(),
             medium::medium_set_str(opts.advertising_mediums).c_str(),
             medium::medium_set_str(opts.upgrade_mediums).c_str(),
             (int)opts.auto_upgrade_bandwidth, (int)opts.low_power);

    auto listener = std::make_shared<tracker::ConnectionTracker>(callback_id, sink_);
    check(provider_.start_advertising(name, service_id, listener, opts), "startAdvertising");
    sink_.post(events::make_event(callback_id, events::AsyncSuccess{}));
}

void ConnectionsBridge::stop_advertising()
{
    check(provider_.stop_advertising(), "stopAdvertising");
}

void ConnectionsBridge::start_discovery(const std::string &callback_id,
                                        const std::string &service_id,
                                        int                discover_selector)
{
    const auto opts =
        medium::discovery_options(static_cast<medium::MediumSelector>(discover_selector));
    LOG_INFO("startDiscovery service=%s mediums=%s", service_id.c_str(),
             medium::medium_set_str(opts.discovery_mediums).c_str());

    auto listener = std::make_shared<tracker::DiscoveryTracker>(callback_id, sink_);
    check(provider_.start_discovery(service_id, listener, opts), "startDiscovery");
}

void ConnectionsBridge::stop_discovery()
{
    check(provider_.stop_discovery(), "stopDiscovery");
}

// ---------------- connections ----------------

void ConnectionsBridge::request_connection(const std::string &callback_id,
                                           const std::string &name,
                                           const std::string &endpoint_id,
                                           int                connect_selector,
                                           int                upgrade_selector,
                                           int                upgrade_type,
                                           std::int32_t       keep_alive_timeout_ms,
                                           std::int32_t       keep_alive_interval_ms)
{
    const auto opts = medium::connection_options(
        static_cast<medium::MediumSelector>(connect_selector),
        static_cast<medium::MediumSelector>(upgrade_selector), upgrade_type,
        keep_alive_timeout_ms, keep_alive_interval_ms);
    LOG_INFO("requestConnection '%s' -> %s mediums=%s upgrade=%s", name.c_str(),
             endpoint_id.c_str(), medium::medium_set_str(opts.connection_mediums).c_str(),
             medium::medium_set_str(opts.upgrade_mediums).c_str());

    auto listener = std::make_shared<tracker::ConnectionTracker>(callback_id, sink_);
    check(provider_.request_connection(name, endpoint_id, listener, opts), "requestConnection");
}

void ConnectionsBridge::accept_connection(const std::string &callback_id,
                                          const std::string &endpoint_id)
{
    auto tracker = std::make_shared<tracker::PayloadTracker>(callback_id, sink_, store_);
    check(provider_.accept_connection(endpoint_id, tracker), "acceptConnection");

    std::lock_guard<std::mutex> lk(mu_);
    payload_trackers_[endpoint_id] = std::move(tracker);
}

void ConnectionsBridge::disconnect_from_endpoint(const std::string &endpoint_id)
{
    check(provider_.disconnect_from_endpoint(endpoint_id), "disconnectFromEndpoint");
    std::lock_guard<std::mutex> lk(mu_);
    payload_trackers_.erase(endpoint_id);
}

void ConnectionsBridge::stop_all_endpoints()
{
    provider_.stop_all_endpoints();
    std::lock_guard<std::mutex> lk(mu_);
    payload_trackers_.clear();
}

std::shared_ptr<tracker::PayloadTracker>
ConnectionsBridge::payload_tracker(const std::string &endpoint_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = payload_trackers_.find(endpoint_id);
    return it == payload_trackers_.end() ? nullptr : it->second;
}

// ---------------- payloads ----------------

std::string ConnectionsBridge::create_sender_file(const std::string &name,
                                                  std::int64_t       size_bytes) const
{
    std::error_code ec;
    fs::create_directories(payload_dir_, ec);
    if (ec)
        throw BridgeError(ErrorKind::ProviderCallFailure,
                          "cannot create payload dir " + payload_dir_ + ": " + ec.message());

    const fs::path path = fs::path(payload_dir_) / (std::string(constants::SENDER_FILE_PREFIX) + name);
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        if (!out)
            throw BridgeError(ErrorKind::ProviderCallFailure, "cannot create " + path.string());
    }
    fs::resize_file(path, static_cast<std::uintmax_t>(size_bytes), ec);
    if (ec)
        throw BridgeError(ErrorKind::ProviderCallFailure,
                          "cannot size " + path.string() + ": " + ec.message());
    return path.string();
}

std::int64_t ConnectionsBridge::send_payload(const std::string &endpoint_id,
                                             const std::string &name,
                                             std::int64_t       size_kb,
                                             int                kind,
                                             int                count)
{
    if (name.empty() || name.find('/') != std::string::npos)
        throw BridgeError(ErrorKind::InvalidArgument, "invalid payload name: '" + name + "'");
    if (size_kb < 0)
        throw BridgeError(ErrorKind::InvalidArgument,
                          "negative payload size: " + std::to_string(size_kb));
    if (size_kb > std::numeric_limits<std::int32_t>::max())
        throw BridgeError(ErrorKind::InvalidArgument,
                          "payload size too large: " + std::to_string(size_kb) + " KiB");
    if (count < 1)
        throw BridgeError(ErrorKind::InvalidArgument,
                          "payload count must be positive: " + std::to_string(count));
    if (kind < static_cast<int>(provider::PayloadKind::Bytes) ||
        kind > static_cast<int>(provider::PayloadKind::Stream))
        throw BridgeError(ErrorKind::InvalidArgument,
                          "Unsupported payload type: " + std::to_string(kind));

    auto tracker = payload_tracker(endpoint_id);
    if (!tracker)
        throw BridgeError(ErrorKind::ProviderCallFailure,
                          "connection to " + endpoint_id + " is not accepted yet");

    tracker->start_transfer_stopwatch();

    std::int64_t last_id = 0;
    for (int i = 0; i < count; ++i)
    {
        const std::string path = create_sender_file(name + std::to_string(i), size_kb * 1024);

        provider::Payload p;
        p.id   = ids::new_payload_id();
        p.size = size_kb * 1024;
        if (static_cast<provider::PayloadKind>(kind) == provider::PayloadKind::Stream)
        {
            auto src = std::make_shared<provider::FileByteSource>(path);
            if (!src->is_open())
                throw BridgeError(ErrorKind::ProviderCallFailure, "cannot open " + path);
            p.kind   = provider::PayloadKind::Stream;
            p.stream = std::move(src);
        }
        else
        {
            // byte payloads of this size are sent file-backed as well
            p.kind      = provider::PayloadKind::File;
            p.file_path = path;
        }

        LOG_INFO("sendPayload %s id=%lld %s %lld bytes", endpoint_id.c_str(), (long long)p.id,
                 tracker::payload_kind_name(p.kind), (long long)p.size);
        last_id = p.id;
        check(provider_.send_payload(endpoint_id, std::move(p)), "sendPayload");
    }
    return last_id;
}

void ConnectionsBridge::transfer_files_cleanup()
{
    std::error_code ec;
    if (!fs::exists(payload_dir_, ec))
        return;

    const std::string prefix(constants::SENDER_FILE_PREFIX);
    std::string       failed;
    for (const auto &entry : fs::directory_iterator(payload_dir_, ec))
    {
        const std::string fname = entry.path().filename().string();
        if (fname.rfind(prefix, 0) != 0)
            continue;
        std::error_code rm_ec;
        if (!fs::remove(entry.path(), rm_ec) || rm_ec)
        {
            LOG_ERROR("remove(%s) failed: %s", entry.path().c_str(), rm_ec.message().c_str());
            failed = entry.path().string();
        }
        else
        {
            LOG_DEBUG("removed %s", entry.path().c_str());
        }
    }
    if (ec)
        throw BridgeError(ErrorKind::ProviderCallFailure,
                          "cannot list " + payload_dir_ + ": " + ec.message());
    if (!failed.empty())
        throw BridgeError(ErrorKind::ProviderCallFailure, "Failed to delete file: " + failed);
}

}  // namespace bridge
