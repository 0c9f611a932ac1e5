#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <gtest/gtest.h>
#include <optional>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace
{
std::string sock_for(const std::string &tag)
{
    return "/tmp/ncbridge-ipc-" + tag + "-" + std::to_string(::getpid()) + ".sock";
}

// Runs ipc::start_server on its own thread for the lifetime of the object.
class ServerThread
{
  public:
    ServerThread(std::string sock, ipc::LineHandler handler) : sock_(std::move(sock))
    {
        worker_ = std::thread([this, h = std::move(handler)] {
            served_ = ipc::start_server(sock_, h);
            done_.store(true);
        });
        for (int tries = 0; tries < 200 && ::access(sock_.c_str(), F_OK) != 0; ++tries)
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    ~ServerThread() { stop(); }

    bool listening() const { return ::access(sock_.c_str(), F_OK) == 0; }

    // Sends QUIT (once) and waits for the server loop to return.
    void stop()
    {
        if (!worker_.joinable())
            return;
        std::string reply;
        if (!done_.load() && listening())
            (void)ipc::request(sock_, "QUIT", reply);
        worker_.join();
    }

    std::optional<bool> served() const { return served_; }

  private:
    std::string         sock_;
    std::thread         worker_;
    std::atomic<bool>   done_{false};
    std::optional<bool> served_;
};

class HomeOverride
{
  public:
    explicit HomeOverride(const char *home)
    {
        if (const char *prev = std::getenv("HOME"))
            prev_ = prev;
        if (home)
            ::setenv("HOME", home, 1);
        else
            ::unsetenv("HOME");
    }
    ~HomeOverride()
    {
        if (prev_)
            ::setenv("HOME", prev_->c_str(), 1);
        else
            ::unsetenv("HOME");
    }

  private:
    std::optional<std::string> prev_;
};
}  // namespace

TEST(IpcPaths, TildeExpandsAgainstHome)
{
    HomeOverride home("/home/ncb");
    EXPECT_EQ(ipc::expand_user("~"), "/home/ncb");
    EXPECT_EQ(ipc::expand_user("~/.cache/ncbridge/ctl.sock"), "/home/ncb/.cache/ncbridge/ctl.sock");
    EXPECT_EQ(ipc::expand_user("/run/ncbridge.sock"), "/run/ncbridge.sock");
    EXPECT_EQ(ipc::expand_user("sockets/~/ctl"), "sockets/~/ctl");
    EXPECT_EQ(ipc::expand_user("~other/ctl.sock"), "~other/ctl.sock");
}

TEST(IpcPaths, TildeKeptWithoutHome)
{
    HomeOverride home(nullptr);
    EXPECT_EQ(ipc::expand_user("~"), "~");
    EXPECT_EQ(ipc::expand_user("~/ctl.sock"), "~/ctl.sock");
}

TEST(IpcServer, NullHandlerAnswersOkAndStopsOnQuit)
{
    const std::string sock = sock_for("quit");
    ServerThread      server(sock, nullptr);
    ASSERT_TRUE(server.listening());

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "GET_LOCAL_ENDPOINT_ID", reply));
    EXPECT_EQ(reply, "OK");
    ASSERT_TRUE(ipc::request(sock, "QUIT", reply));
    EXPECT_EQ(reply, "OK");

    server.stop();
    EXPECT_TRUE(server.served().value_or(false));
    EXPECT_FALSE(server.listening());  // socket file removed on exit
}

TEST(IpcServer, HandlerSeesOneLinePerRequest)
{
    const std::string        sock = sock_for("lines");
    std::vector<std::string> seen;
    ServerThread             server(sock, [&seen](const std::string &line) {
        seen.push_back(line);
        if (line == "EVENT_GET_ALL cb onSuccess")
            return std::string("OK 2\nEVENT cb onSuccess a=1\nEVENT cb onSuccess a=2");
        return "OK " + line.substr(0, line.find(' '));
    });
    ASSERT_TRUE(server.listening());

    std::string reply;
    ASSERT_TRUE(ipc::request(sock, "STOP_DISCOVERY", reply));
    EXPECT_EQ(reply, "OK STOP_DISCOVERY");

    // a trailing newline on the request is optional; CR is dropped by the server
    ASSERT_TRUE(ipc::request(sock, "DISCONNECT PEER\r\n", reply));
    EXPECT_EQ(reply, "OK DISCONNECT");

    // multi-line replies come back whole, minus the final newline
    ASSERT_TRUE(ipc::request(sock, "EVENT_GET_ALL cb onSuccess\n", reply));
    EXPECT_EQ(reply, "OK 2\nEVENT cb onSuccess a=1\nEVENT cb onSuccess a=2");

    server.stop();
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen[0], "STOP_DISCOVERY");
    EXPECT_EQ(seen[1], "DISCONNECT PEER");
    EXPECT_EQ(seen[2], "EVENT_GET_ALL cb onSuccess");
    EXPECT_EQ(seen[3], "QUIT");
}

class IpcFailure : public ::testing::Test
{
  protected:
    void SetUp() override { ncbridge::set_log_level(ncbridge::Level::System); }
    void TearDown() override { ncbridge::set_log_level(ncbridge::Level::Info); }
};

TEST_F(IpcFailure, RequestFailsWithoutServer)
{
    std::string reply = "stale";
    EXPECT_FALSE(ipc::request(sock_for("absent"), "STOP_ALL_ENDPOINTS", reply));
    EXPECT_TRUE(reply.empty());
    EXPECT_FALSE(ipc::request("", "STOP_ALL_ENDPOINTS", reply));
    EXPECT_FALSE(ipc::request(sock_for("absent"), "", reply));
}

TEST_F(IpcFailure, OverlongSocketPathIsRejected)
{
    const std::string path = "/tmp/" + std::string(120, 's') + ".sock";
    EXPECT_FALSE(ipc::start_server(path, nullptr));
    std::string reply;
    EXPECT_FALSE(ipc::request(path, "QUIT", reply));
}
