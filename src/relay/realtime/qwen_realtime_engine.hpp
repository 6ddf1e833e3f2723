#pragma once

#include "../engine.hpp"
#include "../net/ws_connection.hpp"
#include "qwen_wire.hpp"
#include "ws_session.hpp"

#include <chrono>
#include <string>

// DashScope qwen3-asr realtime transcription over JSON events.
class QwenRealtimeEngine : public AsrEngine {
public:
    static constexpr const char* kEndpoint = "wss://dashscope.aliyuncs.com/api-ws/v1/realtime";
    static constexpr const char* kDefaultModel = "qwen3-asr-flash-realtime";

    QwenRealtimeEngine(std::string api_key, WsConnector connector,
                       std::string model = kDefaultModel, std::string language = "zh",
                       std::chrono::milliseconds close_timeout =
                           WsStreamingSession::kDefaultCloseTimeout);

    std::string_view name() const override { return "qwen"; }
    std::vector<AsrMode> supported_modes() const override { return {AsrMode::Realtime}; }

    std::expected<std::string, AsrError>
        transcribe(const AudioBuffer& audio, std::stop_token stop = {}) override;

    std::expected<std::unique_ptr<StreamingSession>, AsrError> create_realtime_session() override;

private:
    std::string api_key_;
    WsConnector connector_;
    std::string model_;
    std::string language_;
    std::chrono::milliseconds close_timeout_;
};

class QwenRealtimeSession : public WsStreamingSession {
public:
    QwenRealtimeSession(std::unique_ptr<WsConnection> conn, std::chrono::milliseconds close_timeout);
    ~QwenRealtimeSession() override;

    std::expected<void, AsrError> handshake(const std::string& language);
    using WsStreamingSession::start;

protected:
    std::expected<void, std::string> write_audio(std::span<const uint8_t> pcm) override;
    std::expected<void, std::string> write_commit() override;
    std::expected<void, std::string> write_finish() override;
    void on_message(const WsMessage& msg) override;
    void on_disconnect(const std::string& reason) override;

private:
    qwen_wire::TranscriptAccumulator transcript_;
};
