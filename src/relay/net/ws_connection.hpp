#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

struct WsMessage {
    enum class Type { Text, Binary, Close };
    Type type = Type::Binary;
    std::string data;
};

struct WsRequest {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
};

// One client socket. send_* is called from a single sender thread and
// receive() from a single receiver thread; implementations must allow the
// two to overlap.
class WsConnection {
public:
    virtual ~WsConnection() = default;

    virtual std::expected<void, std::string> send_text(std::string_view text) = 0;
    virtual std::expected<void, std::string> send_binary(std::span<const uint8_t> data) = 0;

    // Waits up to timeout. nullopt means nothing arrived yet; a Close message
    // (or an error) means the peer is gone.
    virtual std::expected<std::optional<WsMessage>, std::string>
        receive(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

using WsConnector =
    std::function<std::expected<std::unique_ptr<WsConnection>, std::string>(const WsRequest&)>;
