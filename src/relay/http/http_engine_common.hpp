#pragma once

#include "../error.hpp"
#include "../net/http_client.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace http_engine {

inline AsrError transport_error(const HttpError& err, std::chrono::milliseconds timeout) {
    switch (err.kind) {
        case HttpFailure::Timeout:
            return AsrError::timeout(static_cast<uint64_t>(timeout.count()));
        case HttpFailure::Cancelled:
            return AsrError::network("request cancelled");
        case HttpFailure::Network:
            break;
    }
    return AsrError::network(err.message);
}

// Keeps error bodies short enough for a log line.
inline std::string clip(const std::string& body, size_t max_len = 300) {
    if (body.size() <= max_len) return body;
    return body.substr(0, max_len) + "...";
}

} // namespace http_engine
