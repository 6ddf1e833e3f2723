#include "qwen_wire.hpp"

#include "../base64.hpp"

#include <chrono>
#include <format>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace qwen_wire {

std::string make_event_id() {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return std::format("event_{}", ms);
}

std::string session_update(std::string_view language, std::string_view event_id) {
    json event = {
        {"event_id", std::string(event_id)},
        {"type", "session.update"},
        {"session", {
            {"modalities", json::array({"text"})},
            {"input_audio_format", "pcm"},
            {"sample_rate", 16000},
            {"input_audio_transcription", {{"language", std::string(language)}}},
            {"turn_detection", nullptr},
        }},
    };
    return event.dump();
}

std::string audio_append(std::span<const uint8_t> pcm, std::string_view event_id) {
    json event = {
        {"event_id", std::string(event_id)},
        {"type", "input_audio_buffer.append"},
        {"audio", base64::encode(pcm)},
    };
    return event.dump();
}

std::string audio_commit(std::string_view event_id) {
    json event = {
        {"event_id", std::string(event_id)},
        {"type", "input_audio_buffer.commit"},
    };
    return event.dump();
}

std::expected<ServerEvent, AsrError> parse_event(std::string_view message) {
    json j;
    try {
        j = json::parse(message);
    } catch (const json::exception& e) {
        return std::unexpected(AsrError::internal(std::string("event parse error: ") + e.what()));
    }
    if (!j.is_object()) {
        return std::unexpected(AsrError::internal("event is not a JSON object"));
    }

    ServerEvent ev;
    ev.type = j.value("type", "");

    auto take_string = [&](const char* key) {
        if (j.contains(key) && j[key].is_string()) {
            ev.text = j[key].get<std::string>();
            ev.has_text = true;
        }
    };

    if (ev.type == "session.created") {
        ev.kind = EventKind::SessionCreated;
    } else if (ev.type == "session.updated") {
        ev.kind = EventKind::SessionUpdated;
    } else if (ev.type == "input_audio_buffer.committed") {
        ev.kind = EventKind::AudioCommitted;
    } else if (ev.type == "conversation.item.input_audio_transcription.completed") {
        ev.kind = EventKind::TranscriptionCompleted;
        take_string("transcript");
    } else if (ev.type == "response.audio_transcript.delta") {
        ev.kind = EventKind::TranscriptDelta;
        take_string("delta");
    } else if (ev.type == "response.audio_transcript.done") {
        ev.kind = EventKind::TranscriptDone;
        take_string("transcript");
    } else if (ev.type == "response.done") {
        ev.kind = EventKind::ResponseDone;
    } else if (ev.type == "error") {
        ev.kind = EventKind::Error;
        ev.text = "unknown error";
        if (j.contains("error") && j["error"].is_object()) {
            ev.text = j["error"].value("message", ev.text);
        }
        ev.has_text = true;
    }
    return ev;
}

TranscriptAccumulator::Update TranscriptAccumulator::apply(const ServerEvent& event) {
    switch (event.kind) {
        case EventKind::TranscriptionCompleted:
            // Completion without a transcript field does not count.
            if (event.has_text) {
                text_ = event.text;
                completed_ = true;
            }
            return Update::None;
        case EventKind::TranscriptDelta:
            if (event.has_text && !event.text.empty()) {
                text_ += event.text;
                return Update::Partial;
            }
            return Update::None;
        case EventKind::TranscriptDone:
            if (event.has_text) text_ = event.text;
            completed_ = true;
            return Update::None;
        case EventKind::ResponseDone:
            completed_ = true;
            return Update::None;
        case EventKind::Error:
            error_ = event.text;
            return Update::Failed;
        case EventKind::SessionCreated:
        case EventKind::SessionUpdated:
        case EventKind::AudioCommitted:
        case EventKind::Other:
            break;
    }
    return Update::None;
}

} // namespace qwen_wire
