#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <limits>

#include "rpc/dispatcher.hpp"
#include "util/constants.hpp"
#include "util/errors.hpp"
#include "util/log.hpp"

namespace rpc
{

namespace
{

struct BadRequest
{
    std::string message;
};

long long parse_int(const std::string &tok, const char *what)
{
    errno               = 0;
    char     *end       = nullptr;
    long long v         = std::strtoll(tok.c_str(), &end, 10);
    const bool complete = !tok.empty() && end && *end == '\0';
    if (!complete || errno == ERANGE)
        throw BadRequest{std::string("invalid ") + what + ": '" + tok + "'"};
    return v;
}

int parse_i32(const std::string &tok, const char *what)
{
    const long long v = parse_int(tok, what);
    if (v < std::numeric_limits<std::int32_t>::min() ||
        v > std::numeric_limits<std::int32_t>::max())
        throw BadRequest{std::string(what) + " out of range: " + tok};
    return static_cast<int>(v);
}

void need(const std::vector<std::string> &args, std::size_t min, std::size_t max,
          const char *usage)
{
    if (args.size() < min || args.size() > max)
        throw BadRequest{std::string("usage: ") + usage};
}

}  // namespace

std::vector<std::string> split_tokens(const std::string &line)
{
    std::vector<std::string> out;
    std::size_t              i = 0;
    while (i < line.size())
    {
        while (i < line.size() && (line[i] == ' ' || line[i] == '\t'))
            ++i;
        if (i >= line.size())
            break;
        std::size_t j = i;
        while (j < line.size() && line[j] != ' ' && line[j] != '\t')
            ++j;
        out.push_back(events::unescape_token(line.substr(i, j - i)));
        i = j;
    }
    return out;
}

std::string ok_reply(const std::string &value)
{
    return value.empty() ? std::string("OK") : "OK " + value;
}

std::string err_reply(const char *kind, const std::string &message)
{
    std::string msg = message;
    for (auto &c : msg)
        if (c == '\n' || c == '\r')
            c = ' ';
    return std::string("ERR ") + kind + " " + msg;
}

Dispatcher::Dispatcher(bridge::ConnectionsBridge &bridge, events::EventCache &cache)
    : bridge_(bridge), cache_(cache)
{
    cmds_ = {
        {"GET_LOCAL_ENDPOINT_ID",
         [this](const Args &a) {
             need(a, 0, 0, "GET_LOCAL_ENDPOINT_ID");
             return ok_reply(events::escape_token(bridge_.local_endpoint_id()));
         }},
        {"START_ADVERTISING",
         [this](const Args &a) {
             need(a, 5, 5, "START_ADVERTISING cb name service adv upg");
             bridge_.start_advertising(a[0], a[1], a[2], parse_i32(a[3], "advertise medium"),
                                       parse_i32(a[4], "upgrade medium"));
             return ok_reply();
         }},
        {"STOP_ADVERTISING",
         [this](const Args &a) {
             need(a, 0, 0, "STOP_ADVERTISING");
             bridge_.stop_advertising();
             return ok_reply();
         }},
        {"START_DISCOVERY",
         [this](const Args &a) {
             need(a, 3, 3, "START_DISCOVERY cb service disc");
             bridge_.start_discovery(a[0], a[1], parse_i32(a[2], "discovery medium"));
             return ok_reply();
         }},
        {"STOP_DISCOVERY",
         [this](const Args &a) {
             need(a, 0, 0, "STOP_DISCOVERY");
             bridge_.stop_discovery();
             return ok_reply();
         }},
        {"REQUEST_CONNECTION",
         [this](const Args &a) {
             need(a, 8, 8, "REQUEST_CONNECTION cb name endpoint conn upg type ka_timeout ka_interval");
             bridge_.request_connection(a[0], a[1], a[2], parse_i32(a[3], "connection medium"),
                                        parse_i32(a[4], "upgrade medium"),
                                        parse_i32(a[5], "upgrade type"),
                                        parse_i32(a[6], "keep-alive timeout"),
                                        parse_i32(a[7], "keep-alive interval"));
             return ok_reply();
         }},
        {"ACCEPT_CONNECTION",
         [this](const Args &a) {
             need(a, 2, 2, "ACCEPT_CONNECTION cb endpoint");
             bridge_.accept_connection(a[0], a[1]);
             return ok_reply();
         }},
        {"DISCONNECT",
         [this](const Args &a) {
             need(a, 1, 1, "DISCONNECT endpoint");
             bridge_.disconnect_from_endpoint(a[0]);
             return ok_reply();
         }},
        {"SEND_PAYLOAD",
         [this](const Args &a) {
             need(a, 3, 5, "SEND_PAYLOAD endpoint name size_kb [kind] [count]");
             const long long size_kb = parse_int(a[2], "size_kb");
             const int kind  = a.size() > 3 ? parse_i32(a[3], "payload kind")
                                            : static_cast<int>(provider::PayloadKind::File);
             const int count = a.size() > 4 ? parse_i32(a[4], "payload count") : 1;
             const std::int64_t id = bridge_.send_payload(a[0], a[1], size_kb, kind, count);
             return ok_reply(std::to_string(id));
         }},
        {"STOP_ALL_ENDPOINTS",
         [this](const Args &a) {
             need(a, 0, 0, "STOP_ALL_ENDPOINTS");
             bridge_.stop_all_endpoints();
             return ok_reply();
         }},
        {"TRANSFER_FILES_CLEANUP",
         [this](const Args &a) {
             need(a, 0, 0, "TRANSFER_FILES_CLEANUP");
             bridge_.transfer_files_cleanup();
             return ok_reply();
         }},
        {"EVENT_WAIT",
         [this](const Args &a) {
             need(a, 3, 3, "EVENT_WAIT cb name timeout_ms");
             const long long ms = parse_int(a[2], "timeout_ms");
             if (ms < 0)
                 throw BadRequest{"negative timeout_ms: " + a[2]};
             auto ev = cache_.wait_and_get(a[0], a[1], event_wait_timeout(ms));
             if (!ev)
                 return err_reply("timeout", "no " + a[1] + " event for " + a[0] + " within " +
                                                 a[2] + " ms");
             return ok_reply(events::encode_event_line(*ev));
         }},
        {"EVENT_GET_ALL",
         [this](const Args &a) {
             need(a, 2, 2, "EVENT_GET_ALL cb name");
             const auto  evs = cache_.get_all(a[0], a[1]);
             std::string out = ok_reply(std::to_string(evs.size()));
             for (const auto &ev : evs)
                 out += "\n" + events::encode_event_line(ev);
             return out;
         }},
        {"QUIT",
         [](const Args &a) {
             need(a, 0, 0, "QUIT");
             return ok_reply();
         }},
    };
}

std::string Dispatcher::handle(const std::string &line)
{
    auto tokens = split_tokens(line);
    if (tokens.empty())
        return err_reply("bad_request", "empty request");

    const std::string cmd = tokens.front();
    tokens.erase(tokens.begin());

    auto it = cmds_.find(cmd);
    if (it == cmds_.end())
    {
        LOG_WARN("unknown command: %s", cmd.c_str());
        return err_reply("bad_request", "unknown command " + cmd);
    }

    LOG_DEBUG("RPC %s (%zu args)", cmd.c_str(), tokens.size());
    try
    {
        return it->second(tokens);
    }
    catch (const BadRequest &e)
    {
        LOG_WARN("%s: %s", cmd.c_str(), e.message.c_str());
        return err_reply("bad_request", e.message);
    }
    catch (const ncbridge::BridgeError &e)
    {
        return err_reply(ncbridge::error_kind_name(e.kind()), e.what());
    }
    catch (const std::filesystem::filesystem_error &e)
    {
        LOG_ERROR("%s: %s", cmd.c_str(), e.what());
        return err_reply("provider_failure", e.what());
    }
    catch (const std::exception &e)
    {
        LOG_ERROR("%s failed: %s", cmd.c_str(), e.what());
        return err_reply("provider_failure", e.what());
    }
}

std::chrono::milliseconds event_wait_timeout(long long ms)
{
    if (ms > constants::MAX_EVENT_WAIT_MS)
    {
        LOG_DEBUG("EVENT_WAIT timeout %lld ms capped at %lld ms", ms,
                  constants::MAX_EVENT_WAIT_MS);
        ms = constants::MAX_EVENT_WAIT_MS;
    }
    return std::chrono::milliseconds(ms);
}

}  // namespace rpc
