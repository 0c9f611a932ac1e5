#pragma once
#include <chrono>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

#include "bridge/connections_bridge.hpp"
#include "events/event_cache.hpp"

/*
Request line                                              Reply
  GET_LOCAL_ENDPOINT_ID                                   OK <endpoint id>
  START_ADVERTISING cb name service adv upg               OK
  STOP_ADVERTISING                                        OK
  START_DISCOVERY cb service disc                         OK
  STOP_DISCOVERY                                          OK
  REQUEST_CONNECTION cb name endpoint conn upg type       OK
                     ka_timeout ka_interval
  ACCEPT_CONNECTION cb endpoint                           OK
  DISCONNECT endpoint                                     OK
  SEND_PAYLOAD endpoint name size_kb [kind] [count]       OK <last payload id>
  STOP_ALL_ENDPOINTS                                      OK
  TRANSFER_FILES_CLEANUP                                  OK
  EVENT_WAIT cb name timeout_ms                           OK EVENT ...
  EVENT_GET_ALL cb name                                   OK <n>\n EVENT ... (n lines)
  QUIT                                                    OK

Failures: "ERR <invalid_argument|provider_failure|timeout|bad_request> <message>".
Tokens are percent-escaped like event fields.
*/

namespace rpc
{

class Dispatcher
{
  public:
    Dispatcher(bridge::ConnectionsBridge &bridge, events::EventCache &cache);

    // Never throws; every failure becomes an ERR reply.
    std::string handle(const std::string &line);

  private:
    using Args    = std::vector<std::string>;
    using Handler = std::function<std::string(const Args &)>;

    bridge::ConnectionsBridge               &bridge_;
    events::EventCache                      &cache_;
    std::unordered_map<std::string, Handler> cmds_;
};

// Splits on spaces and unescapes each token.
std::vector<std::string> split_tokens(const std::string &line);

// EVENT_WAIT timeout for a non-negative request, capped at constants::MAX_EVENT_WAIT_MS.
std::chrono::milliseconds event_wait_timeout(long long ms);

std::string ok_reply(const std::string &value = {});
std::string err_reply(const char *kind, const std::string &message);

}  // namespace rpc
