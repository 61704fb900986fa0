#pragma once

#include <nlohmann/json.hpp>
#include <string>

// Newline-delimited JSON endpoint. Every request line gets exactly one
// response line; subscribed clients additionally receive pushed events.
class IpcServer {
public:
    virtual ~IpcServer() = default;

    virtual bool start(const std::string& endpoint) = 0;
    virtual void stop() = 0;
    virtual int server_fd() const = 0;
    virtual int accept_client() = 0;

    // One complete request. False when nothing complete is buffered yet or
    // the peer is gone; is_connected() tells the two apart.
    virtual bool read_command(int client_fd, nlohmann::json& cmd) = 0;
    virtual bool is_connected(int client_fd) const = 0;

    virtual bool send_response(int client_fd, const nlohmann::json& response) = 0;
    virtual void close_client(int client_fd) = 0;
};
