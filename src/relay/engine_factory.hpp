#pragma once

#include "config.hpp"
#include "engine.hpp"
#include "net/http_client.hpp"
#include "net/ws_connection.hpp"
#include "retry_policy.hpp"

#include <chrono>
#include <expected>
#include <memory>
#include <optional>
#include <string>

// Transports handed to every engine. Tests swap in fakes.
struct EngineDeps {
    std::shared_ptr<HttpClient> http;
    WsConnector ws_connector;
    // Upper bound on a streaming session's close() wait.
    std::chrono::milliseconds close_timeout{10000};
};

EngineDeps default_engine_deps();

// Validates the credentials, then builds the (provider, mode) variant.
// The HTTP engines take their per-attempt timeout from the retry policy.
std::expected<std::unique_ptr<AsrEngine>, AsrError>
create_engine(const ProviderConfig& config, const RetryPolicy& retry = {},
              const EngineDeps& deps = default_engine_deps());

struct EngineCredentials {
    std::optional<std::string> api_key;
    std::optional<std::string> app_id;
    std::optional<std::string> access_token;

    static EngineCredentials with_api_key(std::string api_key);
    static EngineCredentials with_doubao(std::string app_id, std::string access_token);
};

// Builds an engine from bare credentials with default model and timeout.
std::expected<std::unique_ptr<AsrEngine>, AsrError>
create_engine_by_type(Provider provider, const EngineCredentials& credentials, AsrMode mode,
                      const EngineDeps& deps = default_engine_deps());
