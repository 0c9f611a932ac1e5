#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Returns the reply text for one request line (may span several lines).
using LineHandler = std::function<std::string(const std::string &)>;

// Serves one request line per connection and writes the handler's reply back,
// newline-terminated. Returns after a "QUIT" request has been answered.
bool start_server(const std::string &sock_path, const LineHandler &on_line);

// Sends one line and collects everything the server writes back until it
// closes the connection; the trailing newline is stripped.
bool request(const std::string &sock_path, const std::string &line, std::string &reply);

std::string expand_user(const std::string &path);

}  // namespace ipc
