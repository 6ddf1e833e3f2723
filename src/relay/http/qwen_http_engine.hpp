#pragma once

#include "../engine.hpp"
#include "../net/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

// DashScope multimodal-generation endpoint, base64 WAV as a data URI.
class QwenHttpEngine : public AsrEngine {
public:
    static constexpr const char* kEndpoint =
        "https://dashscope.aliyuncs.com/api/v1/services/aigc/multimodal-generation/generation";
    static constexpr const char* kDefaultModel = "qwen3-asr-flash";

    QwenHttpEngine(std::string api_key, std::shared_ptr<HttpClient> client,
                   std::chrono::milliseconds timeout = std::chrono::milliseconds(6000),
                   std::string model = kDefaultModel, std::string language = "zh");

    std::string_view name() const override { return "qwen"; }
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
    std::string language_;
};
