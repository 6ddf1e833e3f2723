#include "doubao_realtime_engine.hpp"

#include "../logging.hpp"
#include "../request_id.hpp"
#include "doubao_wire.hpp"

#include <format>
#include <utility>

namespace {
constexpr std::chrono::milliseconds kAckTimeout{5000};
}

DoubaoRealtimeEngine::DoubaoRealtimeEngine(std::string app_id, std::string access_token,
                                           WsConnector connector,
                                           std::chrono::milliseconds close_timeout)
    : app_id_(std::move(app_id)),
      access_token_(std::move(access_token)),
      connector_(std::move(connector)),
      close_timeout_(close_timeout) {}

std::expected<std::string, AsrError>
DoubaoRealtimeEngine::transcribe(const AudioBuffer&, std::stop_token) {
    return std::unexpected(
        AsrError::unsupported("doubao realtime engine does not support one-shot transcription"));
}

std::expected<std::unique_ptr<StreamingSession>, AsrError>
DoubaoRealtimeEngine::create_realtime_session() {
    WsRequest req{
        .url = kEndpoint,
        .headers = {
            {"X-Api-App-Key", app_id_},
            {"X-Api-Access-Key", access_token_},
            {"X-Api-Resource-Id", kResourceId},
            {"X-Api-Connect-Id", make_request_id()},
        },
    };

    logging::debug("doubao: connecting to {}", req.url);
    auto conn = connector_(req);
    if (!conn) {
        return std::unexpected(AsrError::wire("doubao websocket connect failed: " + conn.error()));
    }

    auto session = std::make_unique<DoubaoRealtimeSession>(std::move(*conn), close_timeout_);
    if (auto r = session->handshake(app_id_); !r) {
        return std::unexpected(r.error());
    }
    session->start();
    logging::info("doubao: realtime session started");
    return session;
}

DoubaoRealtimeSession::DoubaoRealtimeSession(std::unique_ptr<WsConnection> conn,
                                             std::chrono::milliseconds close_timeout)
    : WsStreamingSession("doubao", std::move(conn), close_timeout) {}

DoubaoRealtimeSession::~DoubaoRealtimeSession() {
    shutdown();
}

std::expected<void, AsrError> DoubaoRealtimeSession::handshake(const std::string& app_id) {
    auto frame = doubao_wire::encode_config_request(doubao_wire::default_config_json(app_id),
                                                    sequence_);
    if (!frame) return std::unexpected(frame.error());

    if (auto r = connection().send_binary(*frame); !r) {
        set_state(SessionState::Failed);
        return std::unexpected(AsrError::wire("doubao config send failed: " + r.error()));
    }
    set_state(SessionState::Configured);

    auto ack = connection().receive(kAckTimeout);
    if (!ack) {
        set_state(SessionState::Failed);
        return std::unexpected(AsrError::wire("doubao handshake failed: " + ack.error()));
    }
    if (!*ack) {
        logging::warn("doubao: no config acknowledgement within {}ms", kAckTimeout.count());
        return {};
    }
    if ((*ack)->type == WsMessage::Type::Close) {
        set_state(SessionState::Failed);
        return std::unexpected(AsrError::wire("doubao closed the connection during handshake"));
    }

    auto bytes = std::span(reinterpret_cast<const uint8_t*>((*ack)->data.data()),
                           (*ack)->data.size());
    auto frame_in = doubao_wire::decode_frame(bytes);
    if (!frame_in) {
        logging::debug("doubao: unreadable config acknowledgement: {}", frame_in.error().message);
        return {};
    }
    if (frame_in->type == doubao_wire::MessageType::ServerError) {
        set_state(SessionState::Failed);
        return std::unexpected(AsrError::wire(
            std::format("doubao rejected configuration: code={} {}", frame_in->error_code,
                        frame_in->error_message)));
    }
    logging::debug("doubao: configuration acknowledged");
    return {};
}

std::expected<void, std::string> DoubaoRealtimeSession::write_audio(std::span<const uint8_t> pcm) {
    return connection().send_binary(doubao_wire::encode_audio(pcm, ++sequence_, false));
}

std::expected<void, std::string> DoubaoRealtimeSession::write_finish() {
    auto frame = doubao_wire::encode_audio({}, ++sequence_, true);
    logging::debug("doubao: sending finish frame (seq -{})", sequence_);
    return connection().send_binary(frame);
}

void DoubaoRealtimeSession::on_message(const WsMessage& msg) {
    if (msg.type != WsMessage::Type::Binary) {
        logging::debug("doubao: ignoring text message");
        return;
    }

    auto bytes = std::span(reinterpret_cast<const uint8_t*>(msg.data.data()), msg.data.size());
    auto frame = doubao_wire::decode_frame(bytes);
    if (!frame) {
        logging::warn("doubao: dropping malformed frame: {}", frame.error().message);
        return;
    }

    if (frame->type == doubao_wire::MessageType::ServerError) {
        auto message = std::format("server error code={}", frame->error_code);
        if (!frame->error_message.empty()) message += ": " + frame->error_message;
        logging::error("doubao: {}", message);
        resolve(std::unexpected(AsrError::wire(message)));
        return;
    }

    auto resp = doubao_wire::read_response(*frame);
    if (!resp) {
        logging::warn("doubao: {}", resp.error().message);
        return;
    }

    if (!resp->text.empty()) {
        text_ = resp->text;
        emit_partial(text_);
    }
    if (resp->is_final) {
        logging::debug("doubao: final response received");
        resolve(text_);
    }
}

void DoubaoRealtimeSession::on_disconnect(const std::string& reason) {
    logging::debug("doubao: connection ended: {}", reason);
    if (!text_.empty()) {
        resolve(text_);
    } else {
        resolve(std::unexpected(AsrError::wire("doubao connection closed without a result: " + reason)));
    }
}
