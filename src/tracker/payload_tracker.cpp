#include <algorithm>
#include <filesystem>
#include <system_error>
#include <vector>

#include "tracker/payload_tracker.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace tracker
{

const char *payload_kind_name(provider::PayloadKind kind)
{
    switch (kind)
    {
        case provider::PayloadKind::Bytes:
            return "BYTES";
        case provider::PayloadKind::File:
            return "FILE";
        case provider::PayloadKind::Stream:
            return "STREAM";
    }
    return "UNKNOWN";
}

// ---------------- FilePayloadStore ----------------

bool FilePayloadStore::release(const provider::Payload &payload)
{
    if (payload.file_path.empty())
        return true;

    std::error_code ec;
    const bool      removed = std::filesystem::remove(payload.file_path, ec);
    if (ec)
    {
        LOG_ERROR("remove(%s) failed: %s", payload.file_path.c_str(), ec.message().c_str());
        return false;
    }
    if (!removed)
        LOG_WARN("received file %s already gone", payload.file_path.c_str());
    return true;
}

// ---------------- PayloadRegistry ----------------

bool PayloadRegistry::insert(const provider::Payload &payload)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto [it, inserted] = map_.try_emplace(payload.id, nullptr);
    if (!inserted)
        return false;
    it->second = std::make_shared<PayloadRecord>(payload);
    return true;
}

std::shared_ptr<PayloadRecord> PayloadRegistry::find(std::int64_t payload_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(payload_id);
    return it == map_.end() ? nullptr : it->second;
}

bool PayloadRegistry::remove(std::int64_t payload_id, const std::shared_ptr<PayloadRecord> &rec)
{
    std::lock_guard<std::mutex> lk(mu_);
    auto                        it = map_.find(payload_id);
    if (it == map_.end() || it->second != rec)
        return false;
    map_.erase(it);
    return true;
}

bool PayloadRegistry::contains(std::int64_t payload_id) const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.count(payload_id) != 0;
}

std::size_t PayloadRegistry::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return map_.size();
}

// ---------------- TransferStopwatch ----------------

void TransferStopwatch::start()
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!start_)
        start_ = std::chrono::steady_clock::now();
}

bool TransferStopwatch::running() const
{
    std::lock_guard<std::mutex> lk(mu_);
    return start_.has_value();
}

std::optional<std::int64_t> TransferStopwatch::elapsed_ns() const
{
    std::lock_guard<std::mutex> lk(mu_);
    if (!start_)
        return std::nullopt;
    using namespace std::chrono;
    return duration_cast<nanoseconds>(steady_clock::now() - *start_).count();
}

// ---------------- PayloadTracker ----------------

PayloadTracker::PayloadTracker(std::string         callback_id,
                               events::IEventSink &sink,
                               IPayloadStore      &store)
    : callback_id_(std::move(callback_id)), sink_(sink), store_(store)
{
}

void PayloadTracker::on_payload_received(const std::string       &endpoint_id,
                                         const provider::Payload &payload)
{
    LOG_DEBUG("PayloadReceived type:%s id:%lld", payload_kind_name(payload.kind),
              (long long)payload.id);

    if (payload.kind == provider::PayloadKind::Stream && !payload.stream)
        LOG_WARN("stream payload %lld arrived without a byte source", (long long)payload.id);

    if (!registry_.insert(payload))
    {
        LOG_WARN("payload %lld already tracked, ignoring repeated announcement",
                 (long long)payload.id);
        return;
    }
    stopwatch_.start();

    events::PayloadReceived ev;
    ev.endpoint_id  = endpoint_id;
    ev.payload_id   = payload.id;
    ev.payload_type = payload_kind_name(payload.kind);
    sink_.post(events::make_event(callback_id_, std::move(ev)));
}

void PayloadTracker::drain_stream(PayloadRecord &rec, std::int64_t bytes_transferred)
{
    std::lock_guard<std::mutex> lk(rec.mu);
    if (rec.closed || !rec.payload.stream)
        return;

    const std::int64_t delta = bytes_transferred - rec.cursor;
    if (delta <= 0)
        return;  // this progress value was already drained

    std::vector<std::uint8_t> buf(
        static_cast<std::size_t>(std::min<std::int64_t>(delta, constants::STREAM_DRAIN_SLICE)));
    std::int64_t drained  = 0;
    bool         io_error = false;
    while (drained < delta)
    {
        const auto want = static_cast<std::size_t>(
            std::min<std::int64_t>(delta - drained, static_cast<std::int64_t>(buf.size())));
        const long n = rec.payload.stream->read(buf.data(), want);
        if (n < 0)
        {
            io_error = true;
            break;
        }
        if (n == 0)
            break;
        drained += n;
    }

    if (io_error)
        LOG_WARN("failed to copy received bytes from stream payload id=%lld",
                 (long long)rec.payload.id);
    if (drained != delta)
        LOG_WARN("expected %lld bytes from incoming stream %lld but got %lld bytes",
                 (long long)delta, (long long)rec.payload.id, (long long)drained);
    rec.cursor += drained;
}

// Returns false when the backing resource could not be released.
bool PayloadTracker::finish_record(PayloadRecord &rec)
{
    std::lock_guard<std::mutex> lk(rec.mu);
    if (rec.closed)
        return true;
    rec.closed = true;

    bool ok = true;
    if (rec.payload.kind == provider::PayloadKind::Stream && rec.payload.stream)
    {
        if (!rec.payload.stream->close())
            LOG_ERROR("failed to close input stream for payload %lld", (long long)rec.payload.id);
        rec.payload.stream.reset();
    }
    if (rec.payload.kind == provider::PayloadKind::File)
    {
        ok = store_.release(rec.payload);
        if (!ok)
            LOG_ERROR("failed to release file of payload %lld (%s)", (long long)rec.payload.id,
                      rec.payload.file_path.c_str());
    }
    return ok;
}

void PayloadTracker::on_payload_transfer_update(const std::string                     &endpoint_id,
                                                const provider::PayloadTransferUpdate &update)
{
    auto rec = registry_.find(update.payload_id);

    if (update.status == provider::TransferStatus::InProgress)
    {
        if (rec && rec->payload.kind == provider::PayloadKind::Stream)
            drain_stream(*rec, update.bytes_transferred);
        return;
    }

    // Terminal: SUCCESS, FAILURE or CANCELED
    bool released = true;
    if (rec)
    {
        released = finish_record(*rec);
        registry_.remove(update.payload_id, rec);
    }

    events::PayloadTransferUpdate ev;
    ev.endpoint_id       = endpoint_id;
    ev.payload_id        = update.payload_id;
    ev.bytes_transferred = update.bytes_transferred;
    ev.total_bytes       = update.total_bytes;
    ev.status_code       = static_cast<int>(update.status);
    ev.is_success        = update.status == provider::TransferStatus::Success && released;
    ev.transfer_time_ns  = stopwatch_.elapsed_ns();

    LOG_SYSTEM("[PAYLOAD] %s id=%lld %lld/%lld bytes status=%d%s", endpoint_id.c_str(),
               (long long)update.payload_id, (long long)update.bytes_transferred,
               (long long)update.total_bytes, ev.status_code,
               rec ? "" : " (not tracked)");
    sink_.post(events::make_event(callback_id_, std::move(ev)));
}

}  // namespace tracker
