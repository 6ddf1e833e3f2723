#pragma once

#include "../engine.hpp"
#include "../net/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

// SiliconFlow hosted SenseVoice: OpenAI-style multipart upload, HTTP only.
class SenseVoiceHttpEngine : public AsrEngine {
public:
    static constexpr const char* kEndpoint = "https://api.siliconflow.cn/v1/audio/transcriptions";
    static constexpr const char* kDefaultModel = "FunAudioLLM/SenseVoiceSmall";

    SenseVoiceHttpEngine(std::string api_key, std::shared_ptr<HttpClient> client,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(6000),
                         std::string model = kDefaultModel);

    std::string_view name() const override { return "sensevoice"; }
    std::vector<AsrMode> supported_modes() const override { return {AsrMode::Http}; }

    std::expected<std::string, AsrError>
        transcribe(const AudioBuffer& audio, std::stop_token stop = {}) override;

    std::expected<std::unique_ptr<StreamingSession>, AsrError>
        create_realtime_session() override;

private:
    std::string api_key_;
    std::shared_ptr<HttpClient> client_;
    std::chrono::milliseconds timeout_;
    std::string model_;
};
