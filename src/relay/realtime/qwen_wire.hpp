#pragma once

#include "../error.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>

// JSON event protocol of the DashScope realtime socket (OpenAI realtime style).
namespace qwen_wire {

std::string make_event_id();

// Audio format, language, text-only modality, server VAD off.
std::string session_update(std::string_view language, std::string_view event_id);
std::string audio_append(std::span<const uint8_t> pcm, std::string_view event_id);
std::string audio_commit(std::string_view event_id);

enum class EventKind {
    SessionCreated,
    SessionUpdated,
    AudioCommitted,
    TranscriptionCompleted,
    TranscriptDelta,
    TranscriptDone,
    ResponseDone,
    Error,
    Other,
};

struct ServerEvent {
    EventKind kind = EventKind::Other;
    std::string type;
    // transcript (completed/done) or delta text; error message for Error.
    std::string text;
    bool has_text = false;
};

std::expected<ServerEvent, AsrError> parse_event(std::string_view message);

// Running transcript for one session. Deltas append; completion events
// replace the buffer when they carry a transcript.
class TranscriptAccumulator {
public:
    enum class Update { None, Partial, Failed };

    Update apply(const ServerEvent& event);

    // A completion-class event was seen and there is text to return.
    bool resolved() const { return completed_ && !text_.empty(); }
    bool completed() const { return completed_; }
    const std::string& text() const { return text_; }
    const std::string& error() const { return error_; }

private:
    std::string text_;
    std::string error_;
    bool completed_ = false;
};

} // namespace qwen_wire
