#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Returns the reply written back to the client before the connection closes ("" = none).
using LineHandler = std::function<std::string(const std::string &line)>;

// Serve one line per connection until a "QUIT" line arrives. Blocks.
bool start_server(const std::string &sock_path, const LineHandler &on_line);

// Fire-and-forget: send one line, ignore any reply.
bool send_line(const std::string &sock_path, const std::string &line);

// Send one line and read the reply until the server closes.
bool request(const std::string &sock_path, const std::string &line, std::string &reply);

std::string expand_user(const std::string &path);

}  // namespace ipc
