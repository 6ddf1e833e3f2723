#pragma once

#include "../engine.hpp"
#include "../net/http_client.hpp"

#include <chrono>
#include <memory>
#include <string>

// Volcengine "flash recognize" endpoint. Outcome is reported through the
// X-Api-Status-Code response header rather than the HTTP status.
class DoubaoHttpEngine : public AsrEngine {
public:
    static constexpr const char* kEndpoint =
        "https://openspeech.bytedance.com/api/v3/auc/bigmodel/recognize/flash";
    static constexpr const char* kResourceId = "volc.bigasr.auc_turbo";
    static constexpr const char* kStatusOk = "20000000";

    DoubaoHttpEngine(std::string app_id, std::string access_key,
                     std::shared_ptr<HttpClient> client,
                     std::chrono::milliseconds timeout = std::chrono::milliseconds(6000));

    std::string_view name() const override { return "doubao"; }
    std::vector<AsrMode> supported_modes() const override { return {AsrMode::Http}; }

    std::expected<std::string, AsrError>
        transcribe(const AudioBuffer& audio, std::stop_token stop = {}) override;

    std::expected<std::unique_ptr<StreamingSession>, AsrError>
        create_realtime_session() override;

private:
    std::string app_id_;
    std::string access_key_;
    std::shared_ptr<HttpClient> client_;
    std::chrono::milliseconds timeout_;
};
