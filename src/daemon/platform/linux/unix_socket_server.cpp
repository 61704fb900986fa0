#include "platform/linux/unix_socket_server.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <print>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

UnixSocketServer::UnixSocketServer() = default;

UnixSocketServer::~UnixSocketServer() {
    stop();
}

bool UnixSocketServer::start(const std::string& endpoint) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (endpoint.size() >= sizeof(addr.sun_path)) {
        std::println(stderr, "ipc: socket path too long: {}", endpoint);
        return false;
    }
    std::strncpy(addr.sun_path, endpoint.c_str(), sizeof(addr.sun_path) - 1);

    // Left behind by a daemon that crashed.
    ::unlink(endpoint.c_str());

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        std::println(stderr, "ipc: socket() failed: {}", std::strerror(errno));
        return false;
    }

    if (::bind(server_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::println(stderr, "ipc: bind({}) failed: {}", endpoint, std::strerror(errno));
        ::close(server_fd_);
        server_fd_ = -1;
        return false;
    }
    socket_path_ = endpoint;
    ::chmod(endpoint.c_str(), 0600);

    if (::listen(server_fd_, 8) < 0) {
        std::println(stderr, "ipc: listen() failed: {}", std::strerror(errno));
        stop();
        return false;
    }

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

bool UnixSocketServer::read_command(int client_fd, nlohmann::json& cmd) {
    auto* client = find_client(client_fd);
    if (!client) return false;

    // A previous recv may have delivered several lines at once.
    if (take_line(*client, cmd)) return true;

    char buf[4096];
    ssize_t n = ::recv(client_fd, buf, sizeof(buf), 0);
    if (n == 0 || (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR)) {
        client->eof = true;
        return false;
    }
    if (n < 0) return false;

    client->buf.append(buf, static_cast<size_t>(n));
    if (take_line(*client, cmd)) return true;

    if (client->buf.size() > kMaxRequestBytes) {
        std::println(stderr, "ipc: request on fd {} exceeds {} bytes, dropping client",
                     client_fd, kMaxRequestBytes);
        client->buf.clear();
        client->eof = true;
    }
    return false;
}

bool UnixSocketServer::take_line(ClientBuffer& client, nlohmann::json& cmd) {
    while (true) {
        auto pos = client.buf.find('\n');
        if (pos == std::string::npos) return false;

        std::string line = client.buf.substr(0, pos);
        client.buf.erase(0, pos + 1);

        try {
            cmd = nlohmann::json::parse(line);
            return true;
        } catch (const nlohmann::json::exception& e) {
            std::println(stderr, "ipc: dropping malformed request: {}", e.what());
        }
    }
}

bool UnixSocketServer::send_response(int client_fd, const nlohmann::json& response) {
    std::string line = response.dump() + "\n";

    // Client sockets are non-blocking; give a slow reader a moment before
    // treating it as gone.
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::send(client_fd, line.data() + off, line.size() - off, MSG_NOSIGNAL);
        if (n > 0) {
            off += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            pollfd pfd{.fd = client_fd, .events = POLLOUT, .revents = 0};
            if (::poll(&pfd, 1, kSendTimeoutMs) > 0) continue;
        }
        return false;
    }
    return true;
}

void UnixSocketServer::close_client(int client_fd) {
    // Untracked fds were already closed; the number may belong to someone else now.
    if (!find_client(client_fd)) return;
    ::close(client_fd);
    std::erase_if(clients_, [client_fd](const ClientBuffer& c) { return c.fd == client_fd; });
}

bool UnixSocketServer::is_connected(int client_fd) const {
    auto* client = find_client(client_fd);
    return client && !client->eof;
}

UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) {
    auto it = std::ranges::find(clients_, fd, &ClientBuffer::fd);
    return it != clients_.end() ? &*it : nullptr;
}

const UnixSocketServer::ClientBuffer* UnixSocketServer::find_client(int fd) const {
    auto it = std::ranges::find(clients_, fd, &ClientBuffer::fd);
    return it != clients_.end() ? &*it : nullptr;
}
