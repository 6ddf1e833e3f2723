#include "curl_ws_connection.hpp"

#include <curl/websockets.h>
#include <poll.h>

std::expected<std::unique_ptr<WsConnection>, std::string>
CurlWsConnection::connect(const WsRequest& request) {
    std::unique_ptr<CurlWsConnection> conn(new CurlWsConnection());
    if (!conn->global_.ok()) {
        return std::unexpected("libcurl not initialized");
    }

    conn->curl_ = curl_easy_init();
    if (!conn->curl_) {
        return std::unexpected("curl_easy_init failed");
    }

    for (const auto& [name, value] : request.headers) {
        conn->headers_ = curl_slist_append(conn->headers_, (name + ": " + value).c_str());
    }

    curl_easy_setopt(conn->curl_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(conn->curl_, CURLOPT_HTTPHEADER, conn->headers_);
    // 2 = WebSocket upgrade only; frames go through curl_ws_send/curl_ws_recv.
    curl_easy_setopt(conn->curl_, CURLOPT_CONNECT_ONLY, 2L);
    curl_easy_setopt(conn->curl_, CURLOPT_CONNECTTIMEOUT, 10L);
    curl_easy_setopt(conn->curl_, CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(conn->curl_);
    if (res != CURLE_OK) {
        return std::unexpected(std::string("websocket connect failed: ") +
                               curl_easy_strerror(res));
    }

    return std::unique_ptr<WsConnection>(std::move(conn));
}

CurlWsConnection::~CurlWsConnection() {
    close();
    if (curl_) curl_easy_cleanup(curl_);
    if (headers_) curl_slist_free_all(headers_);
}

bool CurlWsConnection::wait_socket(short events, std::chrono::milliseconds timeout) {
    curl_socket_t sock = CURL_SOCKET_BAD;
    {
        std::lock_guard lock(mu_);
        if (closed_ || curl_easy_getinfo(curl_, CURLINFO_ACTIVESOCKET, &sock) != CURLE_OK) {
            return false;
        }
    }
    if (sock == CURL_SOCKET_BAD) return false;

    pollfd pfd{.fd = sock, .events = events, .revents = 0};
    return ::poll(&pfd, 1, static_cast<int>(timeout.count())) > 0;
}

std::expected<void, std::string>
CurlWsConnection::send_frame(const char* data, size_t len, unsigned int flags) {
    size_t offset = 0;
    do {
        size_t sent = 0;
        CURLcode rc;
        {
            std::lock_guard lock(mu_);
            if (closed_) return std::unexpected("connection closed");
            rc = curl_ws_send(curl_, data + offset, len - offset, &sent, 0, flags);
        }
        if (rc == CURLE_AGAIN) {
            offset += sent;
            if (!wait_socket(POLLOUT, std::chrono::milliseconds(1000))) {
                return std::unexpected("websocket send timed out");
            }
            continue;
        }
        if (rc != CURLE_OK) {
            return std::unexpected(std::string("websocket send failed: ") + curl_easy_strerror(rc));
        }
        offset += sent;
    } while (offset < len);
    return {};
}

std::expected<void, std::string> CurlWsConnection::send_text(std::string_view text) {
    return send_frame(text.data(), text.size(), CURLWS_TEXT);
}

std::expected<void, std::string> CurlWsConnection::send_binary(std::span<const uint8_t> data) {
    return send_frame(reinterpret_cast<const char*>(data.data()), data.size(), CURLWS_BINARY);
}

std::expected<std::optional<WsMessage>, std::string>
CurlWsConnection::receive(std::chrono::milliseconds timeout) {
    bool waited = false;
    char buf[16384];

    for (;;) {
        size_t rlen = 0;
        const curl_ws_frame* meta = nullptr;
        CURLcode rc;
        {
            std::lock_guard lock(mu_);
            if (closed_) return WsMessage{.type = WsMessage::Type::Close};
            rc = curl_ws_recv(curl_, buf, sizeof(buf), &rlen, &meta);
        }

        if (rc == CURLE_AGAIN) {
            if (waited) return std::nullopt;
            waited = true;
            wait_socket(POLLIN, timeout);
            continue;
        }
        if (rc == CURLE_GOT_NOTHING) {
            return WsMessage{.type = WsMessage::Type::Close};
        }
        if (rc != CURLE_OK) {
            return std::unexpected(std::string("websocket receive failed: ") +
                                   curl_easy_strerror(rc));
        }

        if (meta->flags & CURLWS_CLOSE) {
            partial_.clear();
            return WsMessage{.type = WsMessage::Type::Close};
        }
        // libcurl answers pings itself.
        if (meta->flags & (CURLWS_PING | CURLWS_PONG)) continue;

        if (partial_.empty()) {
            partial_type_ = (meta->flags & CURLWS_TEXT) ? WsMessage::Type::Text
                                                        : WsMessage::Type::Binary;
        }
        partial_.append(buf, rlen);

        if (meta->bytesleft > 0 || (meta->flags & CURLWS_CONT)) continue;

        WsMessage msg{.type = partial_type_, .data = std::move(partial_)};
        partial_.clear();
        return msg;
    }
}

void CurlWsConnection::close() {
    std::lock_guard lock(mu_);
    if (closed_ || !curl_) return;
    size_t sent = 0;
    curl_ws_send(curl_, "", 0, &sent, 0, CURLWS_CLOSE);
    closed_ = true;
}

std::expected<std::unique_ptr<WsConnection>, std::string> curl_ws_connect(const WsRequest& request) {
    return CurlWsConnection::connect(request);
}
