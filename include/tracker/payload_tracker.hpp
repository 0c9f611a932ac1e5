#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "events/event.hpp"
#include "provider/iprovider.hpp"

/*
Incoming payload lifecycle (per payload id)

  on_payload_received      -> registry.insert (stream: cursor = 0)    -> onPayloadReceived
  on_transfer_update(IN_PROGRESS)
      stream               -> drain (bytesTransferred - cursor), cursor += drained
      other                -> nothing
  on_transfer_update(SUCCESS | FAILURE | CANCELED)
      registered           -> close stream / release file, registry.remove
      unknown id (outgoing)-> pass-through
                           -> onPayloadTransferUpdate (+ transferTimeNs while the stopwatch runs)
*/

namespace tracker
{

// Releases the backing resource of a finished incoming file payload.
struct IPayloadStore
{
    virtual bool release(const provider::Payload &payload) = 0;
    virtual ~IPayloadStore()                               = default;
};

// Deletes the received file from disk.
class FilePayloadStore final : public IPayloadStore
{
  public:
    bool release(const provider::Payload &payload) override;
};

struct PayloadRecord
{
    explicit PayloadRecord(provider::Payload p) : payload(std::move(p)) {}

    provider::Payload payload;
    std::int64_t      cursor{0};  // stream bytes already drained
    bool              closed{false};
    std::mutex        mu;  // serializes drain against terminal cleanup
};

// Incoming payloads in flight for one session, keyed by payload id.
class PayloadRegistry
{
  public:
    // false if the id is already tracked
    bool                           insert(const provider::Payload &payload);
    std::shared_ptr<PayloadRecord> find(std::int64_t payload_id) const;
    // Removes the entry only if it still maps to rec.
    bool        remove(std::int64_t payload_id, const std::shared_ptr<PayloadRecord> &rec);
    bool        contains(std::int64_t payload_id) const;
    std::size_t size() const;

  private:
    mutable std::mutex                                                mu_;
    std::unordered_map<std::int64_t, std::shared_ptr<PayloadRecord>> map_;
};

// Started once, sampled on every terminal payload, never reset.
class TransferStopwatch
{
  public:
    void                        start();
    bool                        running() const;
    std::optional<std::int64_t> elapsed_ns() const;

  private:
    mutable std::mutex                                   mu_;
    std::optional<std::chrono::steady_clock::time_point> start_;
};

class PayloadTracker final : public provider::PayloadListener
{
  public:
    PayloadTracker(std::string callback_id, events::IEventSink &sink, IPayloadStore &store);

    void on_payload_received(const std::string       &endpoint_id,
                             const provider::Payload &payload) override;
    void on_payload_transfer_update(const std::string                     &endpoint_id,
                                    const provider::PayloadTransferUpdate &update) override;

    void start_transfer_stopwatch() { stopwatch_.start(); }

    const PayloadRegistry   &registry() const { return registry_; }
    const TransferStopwatch &stopwatch() const { return stopwatch_; }
    const std::string       &callback_id() const { return callback_id_; }

  private:
    void drain_stream(PayloadRecord &rec, std::int64_t bytes_transferred);
    bool finish_record(PayloadRecord &rec);

    std::string         callback_id_;
    events::IEventSink &sink_;
    IPayloadStore      &store_;
    PayloadRegistry     registry_;
    TransferStopwatch   stopwatch_;
};

const char *payload_kind_name(provider::PayloadKind kind);

}  // namespace tracker
