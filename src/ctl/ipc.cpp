#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <utility>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

static bool ensure_parent_dir(const std::string &sock_path)
{
    std::error_code ec;
    fs::path        p(sock_path);
    fs::path        dir = p.parent_path();
    if (dir.empty())
        return true;  // socket in CWD

    if (!fs::exists(dir, ec))
    {
        if (!fs::create_directories(dir, ec))
        {
            LOG_ERROR("create_directories(%s) failed: %s", dir.string().c_str(),
                      ec.message().c_str());
            return false;
        }
    }
    // Enforce 0700 on the directory
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
    {
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.string().c_str(), ec.message().c_str());
    }
    return true;
}

// Fills `addr` for `sock_path`; false (errno set) when the path cannot be used.
static bool unix_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty() || sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = sock_path.empty() ? EINVAL : ENAMETOOLONG;
        LOG_ERROR("unusable control socket path '%s'", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, sock_path.c_str(), sock_path.size() + 1);
    len = static_cast<socklen_t>(offsetof(struct sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

static int cloexec_socket()
{
    int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd == -1)
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
    return fd;
}

static bool write_all(int fd, const std::string &data)
{
    const char *buf  = data.data();
    size_t      len  = data.size();
    size_t      sent = 0;
    while (sent < len)
    {
        ssize_t n = send(fd, buf + sent, len - sent, MSG_NOSIGNAL);
        if (n > 0)
        {
            sent += static_cast<size_t>(n);
            continue;
        }
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("send() failed: %s", std::strerror(errno));
        return false;
    }
    return true;
}

// Reads up to the first newline (or EOF). False on a socket error.
static bool read_line(int fd, std::string &out)
{
    std::string line;
    char        buf[256];
    while (1)
    {
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n > 0)
        {
            line.append(buf, static_cast<size_t>(n));
            if (line.find('\n') != std::string::npos)
                break;
            continue;
        }
        if (n == 0)
            break;  // EOF
        if (n == -1 && errno == EINTR)
            continue;
        LOG_ERROR("recv() failed: %s", std::strerror(errno));
        return false;
    }
    auto pos = line.find('\n');
    out      = (pos == std::string::npos) ? line : line.substr(0, pos);
    if (!out.empty() && out.back() == '\r')
        out.pop_back();
    return true;
}

bool start_server(const std::string &sock_path, const Handler &on_line)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (!unix_addr(sock_path, addr, addr_len) || !ensure_parent_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from an earlier run

    int fd = cloexec_socket();
    if (fd == -1)
        return false;
    if (bind(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1 || listen(fd, 4) == -1)
    {
        int saved = errno;
        close(fd);
        unlink(sock_path.c_str());
        errno = saved;
        LOG_ERROR("bind/listen on %s failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }
    LOG_DEBUG("Listening on %s", sock_path.c_str());

    bool ok = true;
    while (1)
    {
        int conn = accept4(fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (conn == -1)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        std::string line;
        if (!read_line(conn, line))
        {
            close(conn);
            continue;
        }
        const std::string reply = on_line ? on_line(line) : std::string("OK");
        if (!write_all(conn, reply + "\n"))
            LOG_WARN("reply to '%s' not delivered", line.c_str());
        close(conn);

        if (line == "QUIT")
            break;
    }

    close(fd);
    unlink(sock_path.c_str());
    return ok;
}

bool request(const std::string &sock_path, const std::string &line, std::string *reply)
{
    sockaddr_un addr{};
    socklen_t   addr_len = 0;
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("empty request line");
        return false;
    }
    if (!unix_addr(sock_path, addr, addr_len))
        return false;

    int fd = cloexec_socket();
    if (fd == -1)
        return false;
    if (connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) == -1)
    {
        int saved = errno;
        close(fd);
        errno = saved;
        LOG_ERROR("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }
    LOG_DEBUG("request: %s", line.c_str());
    if (!write_all(fd, line + "\n"))
    {
        close(fd);
        return false;
    }
    shutdown(fd, SHUT_WR);

    std::string answer;
    const bool  ok = read_line(fd, answer);
    close(fd);
    if (ok && reply)
        *reply = std::move(answer);
    return ok;
}

std::string expand_user(const std::string &p)
{
    // expand leading '~' or '~/' to $HOME
    if (!p.empty() && p[0] == '~' && (p.size() == 1 || p[1] == '/'))
    {
        const char *home = std::getenv("HOME");
        if (home && (*home))  // non-empty
        {
            return (p.size() == 1) ? std::string(home) : std::string(home) + p.substr(1);
        }
    }
    return p;
}

}  // namespace ipc
