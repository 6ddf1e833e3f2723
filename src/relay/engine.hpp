#pragma once

#include "audio/audio_buffer.hpp"
#include "error.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

enum class AsrMode { Http, Realtime };

std::string_view to_string(AsrMode mode);

struct TranscriptionResult {
    std::string text;
    std::string engine_name;
    bool used_fallback = false;
    std::chrono::milliseconds elapsed{0};
};

enum class SessionState { Connecting, Configured, Streaming, Finishing, Closed, Failed };

std::string_view to_string(SessionState state);

// One open streaming connection. Exactly one terminal result (text or error)
// is ever produced, and it is handed out by close().
class StreamingSession {
public:
    using PartialCallback = std::function<void(const std::string&)>;

    virtual ~StreamingSession() = default;

    // Queues one chunk of PCM16 little-endian bytes for the sender.
    virtual std::expected<void, AsrError> send_chunk(std::span<const uint8_t> pcm) = 0;

    // Marks the end of the buffered input without closing; providers without
    // an explicit commit accept it as a no-op.
    virtual std::expected<void, AsrError> commit() = 0;

    // Sends the provider's finalize signal and waits (bounded) for the result.
    virtual std::expected<std::string, AsrError> close() = 0;

    // Invoked from the session's receiver thread with the best text so far.
    virtual void set_partial_callback(PartialCallback callback) = 0;

    virtual SessionState state() const = 0;
};

// Capability contract shared by every (provider, mode) variant.
class AsrEngine {
public:
    virtual ~AsrEngine() = default;

    virtual std::string_view name() const = 0;
    virtual std::vector<AsrMode> supported_modes() const = 0;

    bool supports_mode(AsrMode mode) const;

    // One-shot transcription. A stop request aborts the call in flight.
    virtual std::expected<std::string, AsrError>
        transcribe(const AudioBuffer& audio, std::stop_token stop = {}) = 0;

    virtual std::expected<std::unique_ptr<StreamingSession>, AsrError>
        create_realtime_session() = 0;
};
