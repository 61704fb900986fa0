#pragma once

#include "platform/ipc_server.hpp"

#include <cstddef>
#include <string>
#include <vector>

class UnixSocketServer : public IpcServer {
public:
    UnixSocketServer();
    ~UnixSocketServer() override;

    UnixSocketServer(const UnixSocketServer&) = delete;
    UnixSocketServer& operator=(const UnixSocketServer&) = delete;

    bool start(const std::string& endpoint) override;
    void stop() override;
    int server_fd() const override { return server_fd_; }
    int accept_client() override;
    bool read_command(int client_fd, nlohmann::json& cmd) override;
    bool is_connected(int client_fd) const override;
    bool send_response(int client_fd, const nlohmann::json& response) override;
    void close_client(int client_fd) override;

private:
    struct ClientBuffer {
        int fd;
        std::string buf;
        bool eof = false;
    };

    ClientBuffer* find_client(int fd);
    const ClientBuffer* find_client(int fd) const;
    static bool take_line(ClientBuffer& client, nlohmann::json& cmd);

    static constexpr int kSendTimeoutMs = 100;
    // Longest request line accepted before the client is dropped.
    static constexpr size_t kMaxRequestBytes = 64 * 1024;

    int server_fd_ = -1;
    std::string socket_path_;
    std::vector<ClientBuffer> clients_;
};
