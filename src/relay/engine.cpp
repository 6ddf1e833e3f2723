#include "engine.hpp"

#include <algorithm>

std::string_view to_string(AsrMode mode) {
    switch (mode) {
        case AsrMode::Http: return "http";
        case AsrMode::Realtime: return "realtime";
    }
    return "unknown";
}

std::string_view to_string(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Configured: return "configured";
        case SessionState::Streaming: return "streaming";
        case SessionState::Finishing: return "finishing";
        case SessionState::Closed: return "closed";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

bool AsrEngine::supports_mode(AsrMode mode) const {
    auto modes = supported_modes();
    return std::find(modes.begin(), modes.end(), mode) != modes.end();
}
