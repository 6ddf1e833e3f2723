#include "qwen_realtime_engine.hpp"

#include "../logging.hpp"
#include "../text_utils.hpp"

#include <utility>

QwenRealtimeEngine::QwenRealtimeEngine(std::string api_key, WsConnector connector,
                                       std::string model, std::string language,
                                       std::chrono::milliseconds close_timeout)
    : api_key_(std::move(api_key)),
      connector_(std::move(connector)),
      model_(std::move(model)),
      language_(std::move(language)),
      close_timeout_(close_timeout) {}

std::expected<std::string, AsrError>
QwenRealtimeEngine::transcribe(const AudioBuffer&, std::stop_token) {
    return std::unexpected(
        AsrError::unsupported("qwen realtime engine does not support one-shot transcription"));
}

std::expected<std::unique_ptr<StreamingSession>, AsrError>
QwenRealtimeEngine::create_realtime_session() {
    WsRequest req{
        .url = std::string(kEndpoint) + "?model=" + model_,
        .headers = {
            {"Authorization", "Bearer " + api_key_},
            {"OpenAI-Beta", "realtime=v1"},
        },
    };

    logging::debug("qwen: connecting to {}", req.url);
    auto conn = connector_(req);
    if (!conn) {
        return std::unexpected(AsrError::wire("qwen websocket connect failed: " + conn.error()));
    }

    auto session = std::make_unique<QwenRealtimeSession>(std::move(*conn), close_timeout_);
    if (auto r = session->handshake(language_); !r) {
        return std::unexpected(r.error());
    }
    session->start();
    logging::info("qwen: realtime session started (model={})", model_);
    return session;
}

QwenRealtimeSession::QwenRealtimeSession(std::unique_ptr<WsConnection> conn,
                                         std::chrono::milliseconds close_timeout)
    : WsStreamingSession("qwen", std::move(conn), close_timeout) {}

QwenRealtimeSession::~QwenRealtimeSession() {
    shutdown();
}

std::expected<void, AsrError> QwenRealtimeSession::handshake(const std::string& language) {
    auto update = qwen_wire::session_update(language, qwen_wire::make_event_id());
    if (auto r = connection().send_text(update); !r) {
        set_state(SessionState::Failed);
        return std::unexpected(AsrError::wire("qwen session.update failed: " + r.error()));
    }
    set_state(SessionState::Configured);
    return {};
}

std::expected<void, std::string> QwenRealtimeSession::write_audio(std::span<const uint8_t> pcm) {
    return connection().send_text(qwen_wire::audio_append(pcm, qwen_wire::make_event_id()));
}

std::expected<void, std::string> QwenRealtimeSession::write_commit() {
    return connection().send_text(qwen_wire::audio_commit(qwen_wire::make_event_id()));
}

// The buffer commit is the end-of-input signal.
std::expected<void, std::string> QwenRealtimeSession::write_finish() {
    logging::debug("qwen: committing audio buffer");
    return write_commit();
}

void QwenRealtimeSession::on_message(const WsMessage& msg) {
    if (msg.type != WsMessage::Type::Text) return;

    auto event = qwen_wire::parse_event(msg.data);
    if (!event) {
        logging::warn("qwen: {}", event.error().message);
        return;
    }
    logging::debug("qwen: event {}", event->type);

    switch (transcript_.apply(*event)) {
        case qwen_wire::TranscriptAccumulator::Update::Partial:
            emit_partial(transcript_.text());
            break;
        case qwen_wire::TranscriptAccumulator::Update::Failed:
            logging::error("qwen: api error: {}", transcript_.error());
            resolve(std::unexpected(AsrError::wire("qwen api error: " + transcript_.error())));
            return;
        case qwen_wire::TranscriptAccumulator::Update::None:
            break;
    }

    if (transcript_.resolved()) {
        resolve(text::strip_all_punctuation(transcript_.text()));
    }
}

void QwenRealtimeSession::on_disconnect(const std::string& reason) {
    logging::debug("qwen: connection ended: {}", reason);
    if (!transcript_.text().empty()) {
        resolve(text::strip_all_punctuation(transcript_.text()));
    } else {
        resolve(std::unexpected(AsrError::wire("qwen connection closed without a result: " + reason)));
    }
}
