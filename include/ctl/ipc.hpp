#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Handler gets one request line (without newline) and returns the reply line.
using Handler = std::function<std::string(const std::string &)>;

// Blocks serving one request per connection until a "QUIT" request has been answered.
bool        start_server(const std::string &sock_path, const Handler &on_line);
// Sends one line and waits for the reply line; reply may be null.
bool        request(const std::string &sock_path, const std::string &line, std::string *reply);
std::string expand_user(const std::string &path);

}  // namespace ipc
