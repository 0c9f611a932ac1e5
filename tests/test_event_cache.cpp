#include <chrono>
#include <gtest/gtest.h>
#include <thread>

#include "events/event_cache.hpp"
#include "util/log.hpp"

using namespace events;
using namespace std::chrono_literals;

TEST(EventCache, WaitReturnsQueuedEventInOrder)
{
    EventCache cache;
    cache.post(make_event("cb", EndpointFound{"A", 1, "a", "svc"}));
    cache.post(make_event("cb", EndpointFound{"B", 2, "b", "svc"}));

    auto first = cache.wait_and_get("cb", "onEndpointFound", 0ms);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(std::get<EndpointFound>(first->payload).endpoint_id, "A");

    auto second = cache.wait_and_get("cb", "onEndpointFound", 0ms);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(std::get<EndpointFound>(second->payload).endpoint_id, "B");

    EXPECT_FALSE(cache.wait_and_get("cb", "onEndpointFound", 0ms).has_value());
}

TEST(EventCache, KeyedByCallbackAndName)
{
    EventCache cache;
    cache.post(make_event("adv", Disconnected{"E"}));

    EXPECT_FALSE(cache.wait_and_get("other", "onDisconnected", 0ms).has_value());
    EXPECT_FALSE(cache.wait_and_get("adv", "onEndpointLost", 0ms).has_value());
    EXPECT_TRUE(cache.wait_and_get("adv", "onDisconnected", 0ms).has_value());
}

TEST(EventCache, WaitTimesOut)
{
    EventCache cache;
    const auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(cache.wait_and_get("cb", "onSuccess", 50ms).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 50ms);
}

TEST(EventCache, WaitWakesOnPost)
{
    EventCache  cache;
    std::thread producer([&] {
        std::this_thread::sleep_for(30ms);
        cache.post(make_event("cb", AsyncSuccess{}));
    });
    auto ev = cache.wait_and_get("cb", "onSuccess", 5s);
    producer.join();
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->callback_id, "cb");
}

TEST(EventCache, GetAllDrainsOneQueue)
{
    EventCache cache;
    for (int i = 0; i < 3; ++i)
        cache.post(make_event("acc", PayloadReceived{"E", i + 1, "FILE"}));
    cache.post(make_event("acc", Disconnected{"E"}));

    auto all = cache.get_all("acc", "onPayloadReceived");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(std::get<PayloadReceived>(all[2].payload).payload_id, 3);
    EXPECT_TRUE(cache.get_all("acc", "onPayloadReceived").empty());
    EXPECT_EQ(cache.size(), 1u);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(EventCache, QueueLimitDropsOldest)
{
    ncbridge::set_log_level(ncbridge::Level::Error);
    EventCache cache(2);
    cache.post(make_event("cb", EndpointLost{"1"}));
    cache.post(make_event("cb", EndpointLost{"2"}));
    cache.post(make_event("cb", EndpointLost{"3"}));
    ncbridge::set_log_level(ncbridge::Level::Info);

    auto all = cache.get_all("cb", "onEndpointLost");
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(std::get<EndpointLost>(all[0].payload).endpoint_id, "2");
    EXPECT_EQ(std::get<EndpointLost>(all[1].payload).endpoint_id, "3");
}
