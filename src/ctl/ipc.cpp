#include <cerrno>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "ctl/ipc.hpp"
#include "util/log.hpp"

namespace ipc
{
namespace fs = std::filesystem;

namespace
{

// Closes fd while keeping the errno of the failure being reported.
void close_keep_errno(int fd)
{
    const int saved = errno;
    ::close(fd);
    errno = saved;
}

bool make_addr(const std::string &sock_path, sockaddr_un &addr, socklen_t &len)
{
    std::memset(&addr, 0, sizeof(addr));
    if (sock_path.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Invalid socket path");
        return false;
    }
    if (sock_path.size() >= sizeof(addr.sun_path))
    {
        errno = ENAMETOOLONG;
        LOG_ERROR("Path name too long for AF_UNIX: %s", sock_path.c_str());
        return false;
    }
    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, sock_path.data(), sock_path.size());
    len = static_cast<socklen_t>(offsetof(sockaddr_un, sun_path) + sock_path.size() + 1);
    return true;
}

// mkdir -p for the socket's directory, then tighten it to 0700
bool prepare_socket_dir(const std::string &sock_path)
{
    const fs::path dir = fs::path(sock_path).parent_path();
    if (dir.empty())
        return true;

    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        LOG_ERROR("create_directories(%s) failed: %s", dir.c_str(), ec.message().c_str());
        return false;
    }
    fs::permissions(dir, fs::perms::owner_all, fs::perm_options::replace, ec);
    if (ec)
        LOG_WARN("permissions(%s, 0700) failed: %s", dir.c_str(), ec.message().c_str());
    return true;
}

bool send_all(int fd, const std::string &data)
{
    std::size_t off = 0;
    while (off < data.size())
    {
        const ssize_t n = ::send(fd, data.data() + off, data.size() - off, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR)
            continue;
        if (n <= 0)
        {
            LOG_ERROR("send() failed: %s", std::strerror(errno));
            return false;
        }
        off += static_cast<std::size_t>(n);
    }
    return true;
}

// Reads until `stop_at_newline` sees '\n' or the peer shuts down its side.
bool recv_text(int fd, std::string &out, bool stop_at_newline)
{
    char buf[4096];
    while (true)
    {
        const ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n == 0)
            return true;
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("recv() failed: %s", std::strerror(errno));
            return false;
        }
        out.append(buf, static_cast<std::size_t>(n));
        if (stop_at_newline && out.find('\n') != std::string::npos)
            return true;
    }
}

std::string first_line(const std::string &text)
{
    std::string line = text.substr(0, text.find('\n'));
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    return line;
}

// Handles one client. Returns true when the request asked the server to stop.
bool serve_client(int client, const LineHandler &on_line)
{
    std::string text;
    if (!recv_text(client, text, true))
        return false;  // keep server alive; accept next connection

    const std::string line  = first_line(text);
    std::string       reply = on_line ? on_line(line) : std::string("OK");
    if (reply.empty() || reply.back() != '\n')
        reply += '\n';
    if (!send_all(client, reply))
        LOG_WARN("reply to '%s' was not delivered", line.c_str());
    return line == "QUIT";
}

}  // namespace

bool start_server(const std::string &sock_path, const LineHandler &on_line)
{
    sockaddr_un addr;
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len) || !prepare_socket_dir(sock_path))
        return false;

    (void)::unlink(sock_path.c_str());  // stale socket from a previous run

    const int listen_fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listen_fd < 0)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    if (::bind(listen_fd, reinterpret_cast<sockaddr *>(&addr), addr_len) < 0)
    {
        close_keep_errno(listen_fd);
        LOG_ERROR("bind(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }
    if (::listen(listen_fd, 8) < 0)
    {
        close_keep_errno(listen_fd);
        ::unlink(sock_path.c_str());
        LOG_ERROR("listen() failed: %s", std::strerror(errno));
        return false;
    }
    LOG_DEBUG("Listening on %s", sock_path.c_str());

    bool ok = true;
    for (bool quit = false; !quit;)
    {
        const int client = ::accept4(listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (client < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("accept() failed: %s", std::strerror(errno));
            ok = false;
            break;
        }
        quit = serve_client(client, on_line);
        ::close(client);
    }

    ::close(listen_fd);
    ::unlink(sock_path.c_str());
    return ok;
}

bool request(const std::string &sock_path, const std::string &line, std::string &reply)
{
    reply.clear();
    if (line.empty())
    {
        errno = EINVAL;
        LOG_ERROR("Refusing to send an empty request");
        return false;
    }

    sockaddr_un addr;
    socklen_t   addr_len = 0;
    if (!make_addr(sock_path, addr, addr_len))
        return false;

    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0)
    {
        LOG_ERROR("socket() failed: %s", std::strerror(errno));
        return false;
    }
    if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), addr_len) < 0)
    {
        close_keep_errno(fd);
        LOG_ERROR("connect(%s) failed: %s", sock_path.c_str(), std::strerror(errno));
        return false;
    }

    LOG_DEBUG("Sending line: %s", line.c_str());
    const std::string out = line.back() == '\n' ? line : line + '\n';
    if (!send_all(fd, out))
    {
        close_keep_errno(fd);
        return false;
    }
    (void)::shutdown(fd, SHUT_WR);  // request complete, reply follows until EOF

    const bool got = recv_text(fd, reply, false);
    ::close(fd);
    if (!got)
        return false;
    if (!reply.empty() && reply.back() == '\n')
        reply.pop_back();
    return true;
}

std::string expand_user(const std::string &p)
{
    if (p.empty() || p[0] != '~' || (p.size() > 1 && p[1] != '/'))
        return p;
    const char *home = std::getenv("HOME");
    if (!home || !*home)
        return p;
    return std::string(home) + p.substr(1);
}

}  // namespace ipc
