#include "error.hpp"

#include <format>

std::string_view to_string(AsrErrorKind kind) {
    switch (kind) {
        case AsrErrorKind::Network: return "network error";
        case AsrErrorKind::AuthFailed: return "authentication failed";
        case AsrErrorKind::QuotaExceeded: return "quota exceeded";
        case AsrErrorKind::InvalidAudio: return "invalid audio";
        case AsrErrorKind::Timeout: return "timeout";
        case AsrErrorKind::WireProtocol: return "wire protocol error";
        case AsrErrorKind::UnsupportedOperation: return "unsupported operation";
        case AsrErrorKind::Config: return "configuration error";
        case AsrErrorKind::Internal: return "internal error";
        case AsrErrorKind::AllEnginesFailed: return "all engines failed";
    }
    return "unknown error";
}

AsrError AsrError::network(std::string message) {
    return {.kind = AsrErrorKind::Network, .message = std::move(message)};
}

AsrError AsrError::auth_failed(std::string provider, std::string message) {
    return {.kind = AsrErrorKind::AuthFailed, .message = std::move(message),
            .provider = std::move(provider)};
}

AsrError AsrError::quota_exceeded(std::string provider) {
    return {.kind = AsrErrorKind::QuotaExceeded, .provider = std::move(provider)};
}

AsrError AsrError::invalid_audio(std::string message) {
    return {.kind = AsrErrorKind::InvalidAudio, .message = std::move(message)};
}

AsrError AsrError::timeout(uint64_t timeout_ms) {
    return {.kind = AsrErrorKind::Timeout, .timeout_ms = timeout_ms};
}

AsrError AsrError::wire(std::string message) {
    return {.kind = AsrErrorKind::WireProtocol, .message = std::move(message)};
}

AsrError AsrError::unsupported(std::string message) {
    return {.kind = AsrErrorKind::UnsupportedOperation, .message = std::move(message)};
}

AsrError AsrError::config(std::string message) {
    return {.kind = AsrErrorKind::Config, .message = std::move(message)};
}

AsrError AsrError::internal(std::string message) {
    return {.kind = AsrErrorKind::Internal, .message = std::move(message)};
}

AsrError AsrError::all_engines_failed(std::string primary_errors,
                                      std::optional<std::string> fallback_error) {
    return {.kind = AsrErrorKind::AllEnginesFailed, .message = std::move(primary_errors),
            .fallback_message = std::move(fallback_error)};
}

bool AsrError::is_retryable() const {
    return kind == AsrErrorKind::Network || kind == AsrErrorKind::Timeout;
}

bool AsrError::is_fail_fast() const {
    return kind == AsrErrorKind::InvalidAudio || kind == AsrErrorKind::Config ||
           kind == AsrErrorKind::UnsupportedOperation;
}

std::string AsrError::to_string() const {
    switch (kind) {
        case AsrErrorKind::AuthFailed:
            return std::format("authentication failed ({}): {}", provider, message);
        case AsrErrorKind::QuotaExceeded:
            return std::format("quota exceeded ({})", provider);
        case AsrErrorKind::Timeout:
            return std::format("request timed out ({}ms)", timeout_ms);
        case AsrErrorKind::AllEnginesFailed:
            return std::format("all engines failed: primary=[{}], fallback=[{}]", message,
                               fallback_message.value_or("none"));
        default:
            return std::format("{}: {}", ::to_string(kind), message);
    }
}
