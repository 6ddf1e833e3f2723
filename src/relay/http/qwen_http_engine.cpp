#include "qwen_http_engine.hpp"

#include "../audio/wav_encoder.hpp"
#include "../base64.hpp"
#include "../logging.hpp"
#include "../text_utils.hpp"
#include "http_engine_common.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

QwenHttpEngine::QwenHttpEngine(std::string api_key, std::shared_ptr<HttpClient> client,
                               std::chrono::milliseconds timeout, std::string model,
                               std::string language)
    : api_key_(std::move(api_key)), client_(std::move(client)), timeout_(timeout),
      model_(std::move(model)), language_(std::move(language)) {}

std::expected<std::string, AsrError>
QwenHttpEngine::transcribe(const AudioBuffer& audio, std::stop_token stop) {
    if (audio.empty()) {
        return std::unexpected(AsrError::invalid_audio("audio buffer is empty"));
    }

    auto wav_data = wav::encode(audio);
    std::string data_uri = "data:audio/wav;base64," + base64::encode(wav_data);

    json body = {
        {"model", model_},
        {"input", {
            {"messages", json::array({
                {{"role", "system"}, {"content", json::array({{{"text", ""}}})}},
                {{"role", "user"}, {"content", json::array({{{"audio", data_uri}}})}},
            })},
        }},
        {"parameters", {
            {"result_format", "message"},
            {"enable_itn", false},
            {"disfluency_removal", true},
            {"language", language_},
        }},
    };

    HttpRequest request{
        .url = kEndpoint,
        .headers = {{"Authorization", "Bearer " + api_key_},
                    {"Content-Type", "application/json"}},
        .body = body.dump(),
        .timeout = timeout_,
    };

    logging::debug("qwen: posting {} bytes of WAV", wav_data.size());

    auto response = client_->post(request, stop);
    if (!response) {
        return std::unexpected(http_engine::transport_error(response.error(), timeout_));
    }

    long status = response->status;
    if (status < 200 || status >= 300) {
        auto body_text = http_engine::clip(response->body);
        switch (status) {
            case 401:
            case 403:
                return std::unexpected(AsrError::auth_failed("qwen", body_text));
            case 429:
                return std::unexpected(AsrError::quota_exceeded("qwen"));
            default:
                return std::unexpected(AsrError::network(
                    std::format("qwen request failed ({}): {}", status, body_text)));
        }
    }

    try {
        auto j = json::parse(response->body);
        const auto& choices = j.at("output").at("choices");
        if (!choices.is_array() || choices.empty()) {
            return std::unexpected(AsrError::internal("qwen response has no choices"));
        }
        const auto& content = choices[0].at("message").at("content");
        if (!content.is_array() || content.empty() || !content[0].contains("text")) {
            return std::unexpected(AsrError::internal("qwen response has no transcript text"));
        }
        auto text = content[0]["text"].get<std::string>();
        return text::strip_trailing_punctuation(text);
    } catch (const json::exception& e) {
        return std::unexpected(AsrError::internal(
            std::string("qwen response parse error: ") + e.what()));
    }
}

std::expected<std::unique_ptr<StreamingSession>, AsrError>
QwenHttpEngine::create_realtime_session() {
    return std::unexpected(AsrError::unsupported(
        "QwenHttpEngine does not stream; use the qwen realtime engine"));
}
