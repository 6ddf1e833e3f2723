#include "sensevoice_http_engine.hpp"

#include "../audio/wav_encoder.hpp"
#include "../logging.hpp"
#include "../text_utils.hpp"
#include "http_engine_common.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

SenseVoiceHttpEngine::SenseVoiceHttpEngine(std::string api_key,
                                           std::shared_ptr<HttpClient> client,
                                           std::chrono::milliseconds timeout, std::string model)
    : api_key_(std::move(api_key)), client_(std::move(client)), timeout_(timeout),
      model_(std::move(model)) {}

std::expected<std::string, AsrError>
SenseVoiceHttpEngine::transcribe(const AudioBuffer& audio, std::stop_token stop) {
    if (audio.empty()) {
        return std::unexpected(AsrError::invalid_audio("audio buffer is empty"));
    }

    auto wav_data = wav::encode(audio);

    HttpRequest request{
        .url = kEndpoint,
        .headers = {{"Authorization", "Bearer " + api_key_}},
        .multipart = {
            {.name = "file",
             .data = std::string(reinterpret_cast<const char*>(wav_data.data()), wav_data.size()),
             .filename = "audio.wav",
             .content_type = "audio/wav"},
            {.name = "model", .data = model_},
        },
        .timeout = timeout_,
    };

    logging::debug("sensevoice: uploading {} bytes of WAV", wav_data.size());

    auto response = client_->post(request, stop);
    if (!response) {
        return std::unexpected(http_engine::transport_error(response.error(), timeout_));
    }

    long status = response->status;
    if (status < 200 || status >= 300) {
        auto body_text = http_engine::clip(response->body);
        switch (status) {
            case 401:
                return std::unexpected(AsrError::auth_failed("sensevoice", body_text));
            case 429:
                return std::unexpected(AsrError::quota_exceeded("sensevoice"));
            case 404:
                return std::unexpected(AsrError::config(
                    "sensevoice model not found or service unavailable: " + body_text));
            case 503:
            case 504:
                return std::unexpected(AsrError::network(std::format(
                    "sensevoice temporarily unavailable ({}): {}", status, body_text)));
            default:
                return std::unexpected(AsrError::network(
                    std::format("sensevoice request failed ({}): {}", status, body_text)));
        }
    }

    try {
        auto j = json::parse(response->body);
        if (!j.contains("text") || !j["text"].is_string()) {
            return std::unexpected(AsrError::internal("sensevoice response has no text"));
        }
        return text::strip_trailing_punctuation(j["text"].get<std::string>());
    } catch (const json::exception& e) {
        return std::unexpected(AsrError::internal(
            std::string("sensevoice response parse error: ") + e.what()));
    }
}

std::expected<std::unique_ptr<StreamingSession>, AsrError>
SenseVoiceHttpEngine::create_realtime_session() {
    return std::unexpected(AsrError::unsupported("sensevoice only supports http mode"));
}
