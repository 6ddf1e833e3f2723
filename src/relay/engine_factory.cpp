#include "engine_factory.hpp"

#include "http/doubao_http_engine.hpp"
#include "http/qwen_http_engine.hpp"
#include "http/sensevoice_http_engine.hpp"
#include "logging.hpp"
#include "net/curl_http_client.hpp"
#include "net/curl_ws_connection.hpp"
#include "realtime/doubao_realtime_engine.hpp"
#include "realtime/qwen_realtime_engine.hpp"

EngineDeps default_engine_deps() {
    return EngineDeps{
        .http = std::make_shared<CurlHttpClient>(),
        .ws_connector = curl_ws_connect,
    };
}

std::expected<std::unique_ptr<AsrEngine>, AsrError>
create_engine(const ProviderConfig& config, const RetryPolicy& retry, const EngineDeps& deps) {
    if (auto r = config.validate(); !r) {
        return std::unexpected(r.error());
    }

    logging::debug("factory: creating {} engine ({})", to_string(config.provider),
                   to_string(config.mode));

    switch (config.provider) {
        case Provider::Qwen:
            switch (config.mode) {
                case AsrMode::Http:
                    return std::make_unique<QwenHttpEngine>(
                        config.dashscope_api_key, deps.http, retry.timeout,
                        config.model.empty() ? QwenHttpEngine::kDefaultModel : config.model,
                        config.language);
                case AsrMode::Realtime:
                    return std::make_unique<QwenRealtimeEngine>(
                        config.dashscope_api_key, deps.ws_connector,
                        config.model.empty() ? QwenRealtimeEngine::kDefaultModel : config.model,
                        config.language, deps.close_timeout);
            }
            break;
        case Provider::Doubao:
            switch (config.mode) {
                case AsrMode::Http:
                    return std::make_unique<DoubaoHttpEngine>(config.app_id, config.access_token,
                                                              deps.http, retry.timeout);
                case AsrMode::Realtime:
                    return std::make_unique<DoubaoRealtimeEngine>(
                        config.app_id, config.access_token, deps.ws_connector, deps.close_timeout);
            }
            break;
        case Provider::SenseVoice:
            return std::make_unique<SenseVoiceHttpEngine>(
                config.siliconflow_api_key, deps.http, retry.timeout,
                config.model.empty() ? SenseVoiceHttpEngine::kDefaultModel : config.model);
    }
    return std::unexpected(AsrError::config("unsupported provider/mode combination"));
}

EngineCredentials EngineCredentials::with_api_key(std::string api_key) {
    return EngineCredentials{.api_key = std::move(api_key)};
}

EngineCredentials EngineCredentials::with_doubao(std::string app_id, std::string access_token) {
    return EngineCredentials{.app_id = std::move(app_id), .access_token = std::move(access_token)};
}

std::expected<std::unique_ptr<AsrEngine>, AsrError>
create_engine_by_type(Provider provider, const EngineCredentials& credentials, AsrMode mode,
                      const EngineDeps& deps) {
    switch (provider) {
        case Provider::Qwen: {
            if (!credentials.api_key) {
                return std::unexpected(AsrError::config("qwen requires an api key"));
            }
            if (mode == AsrMode::Realtime) {
                return std::make_unique<QwenRealtimeEngine>(*credentials.api_key, deps.ws_connector);
            }
            return std::make_unique<QwenHttpEngine>(*credentials.api_key, deps.http);
        }
        case Provider::Doubao: {
            if (!credentials.app_id) {
                return std::unexpected(AsrError::config("doubao requires app_id"));
            }
            if (!credentials.access_token) {
                return std::unexpected(AsrError::config("doubao requires access_token"));
            }
            if (mode == AsrMode::Realtime) {
                return std::make_unique<DoubaoRealtimeEngine>(*credentials.app_id,
                                                              *credentials.access_token,
                                                              deps.ws_connector);
            }
            return std::make_unique<DoubaoHttpEngine>(*credentials.app_id,
                                                      *credentials.access_token, deps.http);
        }
        case Provider::SenseVoice:
            if (!credentials.api_key) {
                return std::unexpected(AsrError::config("sensevoice requires an api key"));
            }
            // HTTP only; a realtime request is answered by the engine itself.
            return std::make_unique<SenseVoiceHttpEngine>(*credentials.api_key, deps.http);
    }
    return std::unexpected(AsrError::config("unknown provider"));
}
