#pragma once

#include "curl_global.hpp"
#include "ws_connection.hpp"

#include <curl/curl.h>
#include <mutex>

// libcurl WebSocket client (CONNECT_ONLY mode, curl_ws_send/curl_ws_recv).
class CurlWsConnection : public WsConnection {
public:
    static std::expected<std::unique_ptr<WsConnection>, std::string>
        connect(const WsRequest& request);

    ~CurlWsConnection() override;

    CurlWsConnection(const CurlWsConnection&) = delete;
    CurlWsConnection& operator=(const CurlWsConnection&) = delete;

    std::expected<void, std::string> send_text(std::string_view text) override;
    std::expected<void, std::string> send_binary(std::span<const uint8_t> data) override;
    std::expected<std::optional<WsMessage>, std::string>
        receive(std::chrono::milliseconds timeout) override;
    void close() override;

private:
    CurlWsConnection() = default;

    std::expected<void, std::string> send_frame(const char* data, size_t len, unsigned int flags);
    bool wait_socket(short events, std::chrono::milliseconds timeout);

    CurlGlobal global_;
    CURL* curl_ = nullptr;
    curl_slist* headers_ = nullptr;
    // Guards curl_ for the overlapping sender and receiver threads.
    std::mutex mu_;
    bool closed_ = false;

    // Reassembly buffer for fragmented messages.
    std::string partial_;
    WsMessage::Type partial_type_ = WsMessage::Type::Binary;
};

// Default connector used by the realtime engines.
std::expected<std::unique_ptr<WsConnection>, std::string> curl_ws_connect(const WsRequest& request);
