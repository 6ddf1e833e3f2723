#include "doubao_http_engine.hpp"

#include "../audio/wav_encoder.hpp"
#include "../base64.hpp"
#include "../logging.hpp"
#include "../request_id.hpp"
#include "../text_utils.hpp"
#include "http_engine_common.hpp"

#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

DoubaoHttpEngine::DoubaoHttpEngine(std::string app_id, std::string access_key,
                                   std::shared_ptr<HttpClient> client,
                                   std::chrono::milliseconds timeout)
    : app_id_(std::move(app_id)), access_key_(std::move(access_key)),
      client_(std::move(client)), timeout_(timeout) {}

std::expected<std::string, AsrError>
DoubaoHttpEngine::transcribe(const AudioBuffer& audio, std::stop_token stop) {
    if (audio.empty()) {
        return std::unexpected(AsrError::invalid_audio("audio buffer is empty"));
    }

    auto wav_data = wav::encode(audio);

    json body = {
        {"user", {{"uid", app_id_}}},
        {"audio", {{"data", base64::encode(wav_data)}}},
        {"request", {{"model_name", "bigmodel"}}},
    };

    HttpRequest request{
        .url = kEndpoint,
        .headers = {
            {"Content-Type", "application/json"},
            {"X-Api-App-Key", app_id_},
            {"X-Api-Access-Key", access_key_},
            {"X-Api-Resource-Id", kResourceId},
            {"X-Api-Request-Id", make_request_id()},
            {"X-Api-Sequence", "-1"},
        },
        .body = body.dump(),
        .timeout = timeout_,
    };

    logging::debug("doubao: posting {} bytes of WAV", wav_data.size());

    auto response = client_->post(request, stop);
    if (!response) {
        return std::unexpected(http_engine::transport_error(response.error(), timeout_));
    }

    auto status_code = response->header("x-api-status-code");
    auto api_message = response->header("x-api-message");
    logging::debug("doubao: status_code={} message={}", status_code, api_message);

    if (status_code != kStatusOk) {
        if (status_code == "40100001" || status_code == "40100002" ||
            status_code == "40300001") {
            return std::unexpected(AsrError::auth_failed("doubao", api_message));
        }
        if (status_code == "42900001") {
            return std::unexpected(AsrError::quota_exceeded("doubao"));
        }
        return std::unexpected(AsrError::network(std::format(
            "doubao recognition failed (status {}, http {}): {}",
            status_code.empty() ? "missing" : status_code, response->status, api_message)));
    }

    try {
        auto j = json::parse(response->body);
        if (!j.contains("result") || !j["result"].contains("text") ||
            !j["result"]["text"].is_string()) {
            return std::unexpected(AsrError::internal("doubao response has no result.text"));
        }
        auto text = j["result"]["text"].get<std::string>();
        return text::strip_trailing_punctuation(text);
    } catch (const json::exception& e) {
        return std::unexpected(AsrError::internal(
            std::string("doubao response parse error: ") + e.what()));
    }
}

std::expected<std::unique_ptr<StreamingSession>, AsrError>
DoubaoHttpEngine::create_realtime_session() {
    return std::unexpected(AsrError::unsupported(
        "DoubaoHttpEngine does not stream; use the doubao realtime engine"));
}
