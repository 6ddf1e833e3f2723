#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

enum class AsrErrorKind {
    Network,
    AuthFailed,
    QuotaExceeded,
    InvalidAudio,
    Timeout,
    WireProtocol,
    UnsupportedOperation,
    Config,
    Internal,
    AllEnginesFailed,
};

std::string_view to_string(AsrErrorKind kind);

struct AsrError {
    AsrErrorKind kind = AsrErrorKind::Internal;
    std::string message;
    // Provider id ("qwen", "doubao", "sensevoice") for per-engine errors.
    std::string provider;
    uint64_t timeout_ms = 0;
    // AllEnginesFailed only: message holds the joined primary attempts.
    std::optional<std::string> fallback_message;

    static AsrError network(std::string message);
    static AsrError auth_failed(std::string provider, std::string message);
    static AsrError quota_exceeded(std::string provider);
    static AsrError invalid_audio(std::string message);
    static AsrError timeout(uint64_t timeout_ms);
    static AsrError wire(std::string message);
    static AsrError unsupported(std::string message);
    static AsrError config(std::string message);
    static AsrError internal(std::string message);
    static AsrError all_engines_failed(std::string primary_errors,
                                       std::optional<std::string> fallback_error);

    // Transient: worth another attempt against the same engine.
    bool is_retryable() const;
    // Structural: no retry and no fallback.
    bool is_fail_fast() const;

    std::string to_string() const;
};
