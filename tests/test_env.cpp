// Environment-driven configuration and log filtering
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <gtest/gtest.h>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>

#include "util/config.hpp"
#include "util/constants.hpp"
#include "util/log.hpp"

namespace
{
// Sets or clears variables for one scope and restores the previous values afterwards.
class ScopedEnv
{
  public:
    ScopedEnv(std::initializer_list<std::pair<const char *, const char *>> vars)
    {
        for (const auto &[name, value] : vars)
        {
            const char *prev = std::getenv(name);
            saved_.emplace(name, prev ? std::optional<std::string>(prev) : std::nullopt);
            assign(name, value);
        }
    }
    ~ScopedEnv()
    {
        for (const auto &[name, prev] : saved_)
            assign(name.c_str(), prev ? prev->c_str() : nullptr);
    }

    static void assign(const char *name, const char *value)
    {
        if (value)
            ::setenv(name, value, 1);
        else
            ::unsetenv(name);
    }

  private:
    std::map<std::string, std::optional<std::string>> saved_;
};

std::string captured_log(const std::function<void()> &emit)
{
    testing::internal::CaptureStderr();
    emit();
    return testing::internal::GetCapturedStderr();
}
}  // namespace

TEST(ConfigPaths, SocketFromEnvironment)
{
    ScopedEnv env({{"NCBRIDGE_CTL_SOCK", "/run/user/1000/ncbridge.sock"}});
    EXPECT_EQ(constants::ctl_sock_path(), "/run/user/1000/ncbridge.sock");
}

TEST(ConfigPaths, DefaultsLiveUnderHomeCache)
{
    const auto home = std::filesystem::temp_directory_path() / "ncbridge-home";
    ScopedEnv  env({{"NCBRIDGE_CTL_SOCK", nullptr},
                    {"NCBRIDGE_PAYLOAD_DIR", ""},
                    {"HOME", home.c_str()}});

    EXPECT_EQ(constants::ctl_sock_path(), (home / ".cache/ncbridge/ctl.sock").string());
    EXPECT_EQ(constants::payload_dir(), (home / ".cache/ncbridge/payloads").string());
}

TEST(ConfigLoad, DefaultsWhenUnset)
{
    ScopedEnv env({{"NCBRIDGE_PROVIDER", nullptr},
                   {"NCBRIDGE_ADAPTER", nullptr},
                   {"NCBRIDGE_EVENT_QUEUE_LIMIT", nullptr},
                   {"NCBRIDGE_LOG_LEVEL", nullptr},
                   {"NCBRIDGE_PAYLOAD_DIR", nullptr},
                   {"HOME", "/home/ncb"}});

    const config::Config c = config::load_from_env();
    EXPECT_EQ(c.provider, config::ProviderKind::Loopback);
    EXPECT_STREQ(config::provider_kind_name(c.provider), "loopback");
    EXPECT_EQ(c.adapter, "hci0");
    EXPECT_EQ(c.log_level, "INFO");
    EXPECT_EQ(c.event_queue_limit, constants::DEFAULT_EVENT_QUEUE_LIMIT);
    EXPECT_EQ(c.payload_dir, "/home/ncb/.cache/ncbridge/payloads");
}

TEST(ConfigLoad, EnvironmentOverrides)
{
    ScopedEnv env({{"NCBRIDGE_PROVIDER", "bluez"},
                   {"NCBRIDGE_ADAPTER", "hci1"},
                   {"NCBRIDGE_EVENT_QUEUE_LIMIT", "16"},
                   {"NCBRIDGE_LOG_LEVEL", "debug"},
                   {"NCBRIDGE_PAYLOAD_DIR", "/var/tmp/ncb-payloads"},
                   {"NCBRIDGE_CTL_SOCK", "~/ncb.sock"},
                   {"HOME", "/home/ncb"}});

    ncbridge::set_log_level(ncbridge::Level::Error);
    const config::Config c = config::load_from_env();
    ncbridge::set_log_level(ncbridge::Level::Info);

    EXPECT_EQ(c.provider, config::ProviderKind::Bluez);
    EXPECT_STREQ(config::provider_kind_name(c.provider), "bluez");
    EXPECT_EQ(c.adapter, "hci1");
    EXPECT_EQ(c.event_queue_limit, 16u);
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.payload_dir, "/var/tmp/ncb-payloads");
    EXPECT_EQ(c.ctl_sock, "/home/ncb/ncb.sock");
}

TEST(ConfigLoad, RejectedValuesAreLoggedAndDefaulted)
{
    ScopedEnv env({{"NCBRIDGE_PROVIDER", "carrier-pigeon"}, {"NCBRIDGE_EVENT_QUEUE_LIMIT", nullptr}});

    for (const char *bad : {"0", "-3", "abc", "12x", "999999"})
    {
        ScopedEnv::assign("NCBRIDGE_EVENT_QUEUE_LIMIT", bad);
        config::Config    c;
        const std::string log = captured_log([&] { c = config::load_from_env(); });

        EXPECT_EQ(c.provider, config::ProviderKind::Loopback);
        EXPECT_EQ(c.event_queue_limit, constants::DEFAULT_EVENT_QUEUE_LIMIT) << bad;
        EXPECT_NE(log.find("NCBRIDGE_EVENT_QUEUE_LIMIT"), std::string::npos) << bad;
        EXPECT_NE(log.find("carrier-pigeon"), std::string::npos);
        EXPECT_NE(log.find("[WARN]"), std::string::npos);
    }
}

TEST(LogFilter, ThresholdFromName)
{
    ncbridge::set_log_level_by_name("Error");
    EXPECT_TRUE(captured_log([] { LOG_WARN("advertising degraded"); }).empty());
    const std::string err = captured_log([] { LOG_ERROR("provider call failed: %d", 8005); });
    EXPECT_NE(err.find("[ERROR]"), std::string::npos);
    EXPECT_NE(err.find("provider call failed: 8005\n"), std::string::npos);

    ncbridge::set_log_level_by_name("warning");
    EXPECT_TRUE(captured_log([] { LOG_INFO("endpoint found"); }).empty());
    EXPECT_FALSE(captured_log([] { LOG_WARN("queue full"); }).empty());

    ncbridge::set_log_level_by_name("DEBUG");
    const std::string dbg = captured_log([] { LOG_DEBUG("payload %lld chunk", 42LL); });
    EXPECT_NE(dbg.find("[DEBUG]"), std::string::npos);
    EXPECT_NE(dbg.find("payload 42 chunk"), std::string::npos);

    // unknown names and nullptr fall back to INFO
    ncbridge::set_log_level_by_name("verbose");
    EXPECT_TRUE(captured_log([] { LOG_DEBUG("hidden"); }).empty());
    EXPECT_FALSE(captured_log([] { LOG_INFO("shown"); }).empty());
    ncbridge::set_log_level_by_name(nullptr);
    EXPECT_TRUE(ncbridge::log_enabled(ncbridge::Level::Info));
    EXPECT_FALSE(ncbridge::log_enabled(ncbridge::Level::Debug));
}

TEST(LogFilter, SystemLinesSurviveErrorThreshold)
{
    ncbridge::set_log_level(ncbridge::Level::Error);
    const std::string out = captured_log([] { LOG_SYSTEM("daemon started"); });
    EXPECT_NE(out.find("[SYSTEM]"), std::string::npos);
    ncbridge::set_log_level(ncbridge::Level::Info);
}
