#include <chrono>
#include <gtest/gtest.h>
#include <mutex>
#include <thread>
#include <vector>

#include "events/event.hpp"
#include "tracker/lifecycle_tracker.hpp"

using namespace std::chrono_literals;

namespace
{
struct RecordingSink : events::IEventSink
{
    std::mutex                 mu;
    std::vector<events::Event> got;

    void post(events::Event ev) override
    {
        std::lock_guard<std::mutex> lk(mu);
        got.push_back(std::move(ev));
    }
};
}  // namespace

TEST(ConnectionTracker, InitiatedCarriesElapsedTimeAndInfo)
{
    RecordingSink              sink;
    tracker::ConnectionTracker t("adv-1", sink);

    std::this_thread::sleep_for(5ms);
    t.on_connection_initiated("E1", provider::ConnectionInfo{"peer", "1234", true});

    ASSERT_EQ(sink.got.size(), 1u);
    EXPECT_EQ(sink.got[0].callback_id, "adv-1");
    const auto &p = std::get<events::ConnectionInitiated>(sink.got[0].payload);
    EXPECT_EQ(p.endpoint_id, "E1");
    EXPECT_EQ(p.endpoint_name, "peer");
    EXPECT_EQ(p.authentication_digits, "1234");
    EXPECT_TRUE(p.is_incoming);
    EXPECT_GE(p.connection_time_ns, 5'000'000);
}

TEST(ConnectionTracker, FullSessionSequence)
{
    RecordingSink              sink;
    tracker::ConnectionTracker t("conn", sink);

    t.on_connection_initiated("E", provider::ConnectionInfo{"n", "d", false});
    t.on_connection_result("E", provider::ConnectionResolution{provider::status::kSuccess});
    t.on_bandwidth_changed("E", provider::BandwidthInfo{provider::UpgradeStatus::Upgraded,
                                                        provider::BwQuality::High,
                                                        medium::Medium::WifiLan});
    t.on_disconnected("E");

    ASSERT_EQ(sink.got.size(), 4u);
    EXPECT_STREQ(events::event_name(sink.got[0]), "onConnectionInitiated");
    EXPECT_STREQ(events::event_name(sink.got[1]), "onConnectionResult");
    EXPECT_STREQ(events::event_name(sink.got[2]), "onBandwidthChanged");
    EXPECT_STREQ(events::event_name(sink.got[3]), "onDisconnected");

    const auto &res = std::get<events::ConnectionResult>(sink.got[1].payload);
    EXPECT_EQ(res.status_code, 0);
    EXPECT_TRUE(res.is_success);

    const auto &bw = std::get<events::BandwidthChanged>(sink.got[2].payload);
    EXPECT_EQ(bw.upgrade_status, static_cast<int>(provider::UpgradeStatus::Upgraded));
    EXPECT_EQ(bw.quality, static_cast<int>(provider::BwQuality::High));
    EXPECT_TRUE(bw.is_high_quality);
    EXPECT_EQ(bw.medium, static_cast<int>(medium::Medium::WifiLan));
}

TEST(ConnectionTracker, RejectedResult)
{
    RecordingSink              sink;
    tracker::ConnectionTracker t("conn", sink);
    t.on_connection_result("E",
                           provider::ConnectionResolution{provider::status::kConnectionRejected});

    const auto &res = std::get<events::ConnectionResult>(sink.got.at(0).payload);
    EXPECT_EQ(res.status_code, provider::status::kConnectionRejected);
    EXPECT_FALSE(res.is_success);
}

TEST(ConnectionTracker, LowQualityIsNotHigh)
{
    RecordingSink              sink;
    tracker::ConnectionTracker t("conn", sink);
    t.on_bandwidth_changed("E", provider::BandwidthInfo{provider::UpgradeStatus::Failed,
                                                        provider::BwQuality::Low,
                                                        medium::Medium::Ble});
    const auto &bw = std::get<events::BandwidthChanged>(sink.got.at(0).payload);
    EXPECT_FALSE(bw.is_high_quality);
    EXPECT_EQ(bw.upgrade_status, static_cast<int>(provider::UpgradeStatus::Failed));
}

TEST(DiscoveryTracker, FoundAndLost)
{
    RecordingSink             sink;
    tracker::DiscoveryTracker t("disc", sink);

    t.on_endpoint_found("E9", provider::DiscoveredEndpointInfo{"phone", "svc"});
    t.on_endpoint_lost("E9");

    ASSERT_EQ(sink.got.size(), 2u);
    const auto &found = std::get<events::EndpointFound>(sink.got[0].payload);
    EXPECT_EQ(found.endpoint_id, "E9");
    EXPECT_EQ(found.endpoint_name, "phone");
    EXPECT_EQ(found.service_id, "svc");
    EXPECT_GE(found.discovery_time_ns, 0);
    EXPECT_EQ(std::get<events::EndpointLost>(sink.got[1].payload).endpoint_id, "E9");
    EXPECT_EQ(sink.got[1].callback_id, "disc");
}
