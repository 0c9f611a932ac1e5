#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "events/event.hpp"
#include "util/constants.hpp"

namespace events
{

// Per (callback id, event name) FIFO the driver polls or blocks on.
class EventCache final : public IEventSink
{
  public:
    explicit EventCache(std::size_t queue_limit = constants::DEFAULT_EVENT_QUEUE_LIMIT);

    void post(Event ev) override;

    // Blocks until an event for (callback_id, name) is available or timeout passes.
    std::optional<Event> wait_and_get(const std::string        &callback_id,
                                      const std::string        &name,
                                      std::chrono::milliseconds timeout);

    // Removes and returns every queued event for (callback_id, name).
    std::vector<Event> get_all(const std::string &callback_id, const std::string &name);

    void        clear();
    std::size_t size() const;

  private:
    using Key = std::pair<std::string, std::string>;

    std::size_t                      limit_;
    mutable std::mutex               mu_;
    std::condition_variable          cv_;
    std::map<Key, std::deque<Event>> queues_;
};

}  // namespace events
