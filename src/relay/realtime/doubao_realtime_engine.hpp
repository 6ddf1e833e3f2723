#pragma once

#include "../engine.hpp"
#include "../net/ws_connection.hpp"
#include "ws_session.hpp"

#include <chrono>
#include <string>

// Volcengine bigmodel streaming recognition over the binary frame protocol.
class DoubaoRealtimeEngine : public AsrEngine {
public:
    static constexpr const char* kEndpoint =
        "wss://openspeech.bytedance.com/api/v3/sauc/bigmodel_nostream";
    static constexpr const char* kResourceId = "volc.seedasr.sauc.duration";

    DoubaoRealtimeEngine(std::string app_id, std::string access_token, WsConnector connector,
                         std::chrono::milliseconds close_timeout =
                             WsStreamingSession::kDefaultCloseTimeout);

    std::string_view name() const override { return "doubao"; }
    std::vector<AsrMode> supported_modes() const override { return {AsrMode::Realtime}; }

    std::expected<std::string, AsrError>
        transcribe(const AudioBuffer& audio, std::stop_token stop = {}) override;

    std::expected<std::unique_ptr<StreamingSession>, AsrError> create_realtime_session() override;

private:
    std::string app_id_;
    std::string access_token_;
    WsConnector connector_;
    std::chrono::milliseconds close_timeout_;
};

class DoubaoRealtimeSession : public WsStreamingSession {
public:
    DoubaoRealtimeSession(std::unique_ptr<WsConnection> conn, std::chrono::milliseconds close_timeout);
    ~DoubaoRealtimeSession() override;

    // Sends the configuration frame and reads the server's acknowledgement.
    std::expected<void, AsrError> handshake(const std::string& app_id);
    using WsStreamingSession::start;

protected:
    std::expected<void, std::string> write_audio(std::span<const uint8_t> pcm) override;
    std::expected<void, std::string> write_finish() override;
    void on_message(const WsMessage& msg) override;
    void on_disconnect(const std::string& reason) override;

private:
    // Sequence 1 is the configuration frame; audio continues from 2.
    int32_t sequence_ = 1;
    std::string text_;
};
