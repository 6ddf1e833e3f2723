#include "config.hpp"

#include "logging.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <format>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

std::string_view to_string(Provider provider) {
    switch (provider) {
        case Provider::Qwen: return "qwen";
        case Provider::Doubao: return "doubao";
        case Provider::SenseVoice: return "sensevoice";
    }
    return "unknown";
}

std::string_view to_string(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::Sequential: return "sequential";
        case StrategyKind::Parallel: return "parallel";
        case StrategyKind::Race: return "race";
    }
    return "unknown";
}

std::optional<Provider> parse_provider(std::string_view s) {
    if (s == "qwen") return Provider::Qwen;
    if (s == "doubao") return Provider::Doubao;
    if (s == "sensevoice") return Provider::SenseVoice;
    return std::nullopt;
}

std::optional<AsrMode> parse_mode(std::string_view s) {
    if (s == "http") return AsrMode::Http;
    if (s == "realtime") return AsrMode::Realtime;
    return std::nullopt;
}

std::optional<StrategyKind> parse_strategy(std::string_view s) {
    if (s == "sequential") return StrategyKind::Sequential;
    if (s == "parallel") return StrategyKind::Parallel;
    if (s == "race") return StrategyKind::Race;
    return std::nullopt;
}

std::expected<void, AsrError> ProviderConfig::validate() const {
    switch (provider) {
        case Provider::Qwen:
            if (dashscope_api_key.empty()) {
                return std::unexpected(AsrError::config("qwen requires dashscope_api_key"));
            }
            break;
        case Provider::Doubao:
            if (app_id.empty()) {
                return std::unexpected(AsrError::config("doubao requires app_id"));
            }
            if (access_token.empty()) {
                return std::unexpected(AsrError::config("doubao requires access_token"));
            }
            break;
        case Provider::SenseVoice:
            if (siliconflow_api_key.empty()) {
                return std::unexpected(AsrError::config("sensevoice requires siliconflow_api_key"));
            }
            if (mode != AsrMode::Http) {
                return std::unexpected(AsrError::config("sensevoice only supports http mode"));
            }
            break;
    }
    return {};
}

namespace {

std::expected<ProviderConfig, AsrError> provider_from_json(const json& j, std::string_view where) {
    if (!j.is_object()) {
        return std::unexpected(AsrError::config(std::format("{}: expected an object", where)));
    }

    ProviderConfig pc;
    auto provider_name = j.value("provider", std::string(to_string(pc.provider)));
    auto provider = parse_provider(provider_name);
    if (!provider) {
        return std::unexpected(
            AsrError::config(std::format("{}: unknown provider '{}'", where, provider_name)));
    }
    pc.provider = *provider;

    auto mode_name = j.value("mode", std::string(to_string(pc.mode)));
    auto mode = parse_mode(mode_name);
    if (!mode) {
        return std::unexpected(
            AsrError::config(std::format("{}: unknown mode '{}'", where, mode_name)));
    }
    pc.mode = *mode;

    if (j.contains("dashscope_api_key")) pc.dashscope_api_key = j["dashscope_api_key"].get<std::string>();
    if (j.contains("siliconflow_api_key")) pc.siliconflow_api_key = j["siliconflow_api_key"].get<std::string>();
    if (j.contains("app_id")) pc.app_id = j["app_id"].get<std::string>();
    if (j.contains("access_token")) pc.access_token = j["access_token"].get<std::string>();
    if (j.contains("model")) pc.model = j["model"].get<std::string>();
    if (j.contains("language")) pc.language = j["language"].get<std::string>();
    return pc;
}

} // namespace

std::expected<AsrConfig, AsrError> AsrConfig::parse(std::string_view json_text) {
    AsrConfig cfg;
    try {
        auto j = json::parse(json_text);
        if (!j.is_object()) {
            return std::unexpected(AsrError::config("config root must be an object"));
        }

        if (j.contains("primary")) {
            auto primary = provider_from_json(j["primary"], "primary");
            if (!primary) return std::unexpected(primary.error());
            cfg.primary = std::move(*primary);
        }

        if (j.contains("fallback") && !j["fallback"].is_null()) {
            auto fallback = provider_from_json(j["fallback"], "fallback");
            if (!fallback) return std::unexpected(fallback.error());
            cfg.fallback = std::move(*fallback);
        }

        if (j.contains("enable_fallback")) cfg.enable_fallback = j["enable_fallback"].get<bool>();

        if (j.contains("strategy")) {
            auto name = j["strategy"].get<std::string>();
            auto kind = parse_strategy(name);
            if (!kind) {
                return std::unexpected(AsrError::config(std::format("unknown strategy '{}'", name)));
            }
            cfg.strategy = *kind;
        }

        if (j.contains("retry")) {
            auto& r = j["retry"];
            if (r.contains("max_retries")) {
                if (!r["max_retries"].is_number_unsigned() ||
                    r["max_retries"].get<uint64_t>() > RetryPolicy::kMaxRetries) {
                    return std::unexpected(AsrError::config(std::format(
                        "retry.max_retries must be an integer in [0, {}], got {}",
                        RetryPolicy::kMaxRetries, r["max_retries"].dump())));
                }
                cfg.retry.max_retries = r["max_retries"].get<uint32_t>();
            }
            if (r.contains("base_delay_ms")) {
                cfg.retry.base_delay = std::chrono::milliseconds(r["base_delay_ms"].get<uint64_t>());
            }
            if (r.contains("timeout_ms")) {
                cfg.retry.timeout = std::chrono::milliseconds(r["timeout_ms"].get<uint64_t>());
            }
        }
    } catch (const json::exception& e) {
        return std::unexpected(AsrError::config(std::string("config parse error: ") + e.what()));
    }
    return cfg;
}

AsrConfig AsrConfig::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        logging::warn("config: could not open {}, using defaults", path);
        return AsrConfig{};
    }

    std::stringstream ss;
    ss << f.rdbuf();
    auto cfg = parse(ss.str());
    if (!cfg) {
        logging::warn("config: {}, using defaults", cfg.error().message);
        return AsrConfig{};
    }
    return *cfg;
}

AsrConfig AsrConfig::load_default() {
    auto dir = config_dir();
    if (dir.empty()) return AsrConfig{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return AsrConfig{};
}

std::string config_dir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg) return std::string(xdg) + "/asr-relay";
    const char* home = std::getenv("HOME");
    if (!home) return {};
    return std::string(home) + "/.config/asr-relay";
}
