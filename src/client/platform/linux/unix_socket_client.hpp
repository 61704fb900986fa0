#pragma once

#include "platform/ipc_client.hpp"

#include <optional>
#include <string>

class UnixSocketClient : public IpcClient {
public:
    UnixSocketClient();
    ~UnixSocketClient() override;

    UnixSocketClient(const UnixSocketClient&) = delete;
    UnixSocketClient& operator=(const UnixSocketClient&) = delete;

    bool connect(const std::string& endpoint) override;
    bool send(const nlohmann::json& cmd) override;
    bool recv(nlohmann::json& response, int timeout_ms = 5000) override;
    void close() override;

private:
    // Next buffered line, if one is complete.
    std::optional<std::string> take_line();

    int fd_ = -1;
    // Bytes past the last complete line; subscriptions push several.
    std::string buf_;
};
