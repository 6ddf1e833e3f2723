#pragma once

#include "engine.hpp"
#include "error.hpp"
#include "retry_policy.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>

enum class Provider { Qwen, Doubao, SenseVoice };
enum class StrategyKind { Sequential, Parallel, Race };

std::string_view to_string(Provider provider);
std::string_view to_string(StrategyKind kind);
std::optional<Provider> parse_provider(std::string_view s);
std::optional<AsrMode> parse_mode(std::string_view s);
std::optional<StrategyKind> parse_strategy(std::string_view s);

struct ProviderConfig {
    Provider provider = Provider::Qwen;
    AsrMode mode = AsrMode::Http;
    std::string dashscope_api_key;
    std::string siliconflow_api_key;
    std::string app_id;
    std::string access_token;
    // Empty: the engine's default model.
    std::string model;
    std::string language = "zh";

    // Fails closed when a credential required by (provider, mode) is missing.
    std::expected<void, AsrError> validate() const;
};

struct AsrConfig {
    ProviderConfig primary;
    std::optional<ProviderConfig> fallback;
    bool enable_fallback = true;
    StrategyKind strategy = StrategyKind::Sequential;
    RetryPolicy retry;

    // Strict: unknown provider/mode/strategy names are Config errors.
    static std::expected<AsrConfig, AsrError> parse(std::string_view json_text);
    static AsrConfig load(const std::string& path);
    static AsrConfig load_default();
};

std::string config_dir();
