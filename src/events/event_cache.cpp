#include "events/event_cache.hpp"
#include "util/log.hpp"

namespace events
{

EventCache::EventCache(std::size_t queue_limit) : limit_(queue_limit == 0 ? 1 : queue_limit) {}

void EventCache::post(Event ev)
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        Key   key{ev.callback_id, event_name(ev)};
        auto &q = queues_[key];
        if (q.size() >= limit_)
        {
            LOG_WARN("event queue %s/%s full (%zu), dropping oldest", key.first.c_str(),
                     key.second.c_str(), limit_);
            q.pop_front();
        }
        LOG_DEBUG("post %s/%s", key.first.c_str(), key.second.c_str());
        q.push_back(std::move(ev));
    }
    cv_.notify_all();
}

std::optional<Event> EventCache::wait_and_get(const std::string        &callback_id,
                                              const std::string        &name,
                                              std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lk(mu_);
    const Key                    key{callback_id, name};
    auto has_event = [&] {
        auto it = queues_.find(key);
        return it != queues_.end() && !it->second.empty();
    };
    if (!cv_.wait_for(lk, timeout, has_event))
        return std::nullopt;

    auto &q  = queues_[key];
    Event ev = std::move(q.front());
    q.pop_front();
    return ev;
}

std::vector<Event> EventCache::get_all(const std::string &callback_id, const std::string &name)
{
    std::lock_guard<std::mutex> lk(mu_);
    std::vector<Event>          out;
    auto                        it = queues_.find(Key{callback_id, name});
    if (it == queues_.end())
        return out;
    out.reserve(it->second.size());
    for (auto &ev : it->second)
        out.push_back(std::move(ev));
    queues_.erase(it);
    return out;
}

void EventCache::clear()
{
    std::lock_guard<std::mutex> lk(mu_);
    queues_.clear();
}

std::size_t EventCache::size() const
{
    std::lock_guard<std::mutex> lk(mu_);
    std::size_t                 n = 0;
    for (const auto &kv : queues_)
        n += kv.second.size();
    return n;
}

}  // namespace events
