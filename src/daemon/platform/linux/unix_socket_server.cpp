#include "platform/linux/unix_socket_server.hpp"

#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& socket_path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (socket_path.size() >= sizeof(addr.sun_path)) {
        logging::error("ipc", "socket path too long: " + socket_path);
        return false;
    }
    std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

    // Stale socket from a previous run
    ::unlink(socket_path.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        logging::error("ipc", std::string("socket() failed: ") + std::strerror(errno));
        return false;
    }

    auto fail = [this](const char* call) {
        logging::error("ipc", std::string(call) + " failed: " + std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    };

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) return fail("bind()");
    socket_path_ = socket_path;

    // Consent and audit commands: owner only.
    if (::chmod(socket_path.c_str(), 0600) < 0) return fail("chmod()");
    if (::listen(server_fd_, 8) < 0) return fail("listen()");

    return true;
}

void UnixSocketServer::stop() {
    for (auto& c : clients_) {
        ::close(c.fd);
    }
    clients_.clear();

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    if (!socket_path_.empty()) {
        ::unlink(socket_path_.c_str());
        socket_path_.clear();
    }
}

int UnixSocketServer::accept_client() {
    int fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (fd < 0) return -1;
    clients_.push_back({fd, {}});
    return fd;
}

bool UnixSocketServer::read_commands(int client_fd, std::vector<nlohmann::json>& cmds) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    // Lines that arrived before a hangup are still handed out.
    bool open = true;
    char buf[4096];
    for (;;) {
        ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
        if (n == 0) {
            open = false;
            break;
        }
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) break;
            open = false;
            break;
        }
        client->buf.append(buf, static_cast<size_t>(n));
    }

    size_t pos;
    while ((pos = client->buf.find('\n')) != std::string::npos) {
        cmds.push_back(nlohmann::json::parse(client->buf.substr(0, pos), nullptr, false));
        client->buf.erase(0, pos + 1);
    }

    if (client->buf.size() > kMaxLine) {
        logging::error("ipc", "client sent an oversized line, disconnecting");
        return false;
    }
    return open;
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string msg = response.dump() + "\n";
    size_t off = 0;
    while (off < msg.size()) {
        ssize_t n = ::send(client_fd, msg.data() + off, msg.size() - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
            int ret = ::poll(&pfd, 1, kSendTimeoutMs);
            if (ret < 0 && errno == EINTR) continue;
            if (ret > 0) continue;
            logging::error("ipc", "client not reading, response dropped");
        }
        return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find_if(clients_, [fd](const ClientBuffer& c) { return c.fd == fd; });
    return it != clients_.end() ? &*it : nullptr;
}
