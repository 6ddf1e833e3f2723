#include "ws_session.hpp"

#include "../logging.hpp"

#include <format>
#include <utility>

namespace {
constexpr std::chrono::milliseconds kReceivePoll{100};
}

WsStreamingSession::WsStreamingSession(std::string provider, std::unique_ptr<WsConnection> conn,
                                       std::chrono::milliseconds close_timeout)
    : provider_(std::move(provider)),
      conn_(std::move(conn)),
      close_timeout_(close_timeout),
      result_future_(result_promise_.get_future()) {}

WsStreamingSession::~WsStreamingSession() {
    shutdown();
}

void WsStreamingSession::start() {
    state_.store(SessionState::Streaming);
    sender_ = std::jthread([this] { sender_loop(); });
    receiver_ = std::jthread([this](std::stop_token st) { receiver_loop(st); });
}

void WsStreamingSession::shutdown() {
    std::call_once(shutdown_once_, [this] {
        commands_.close();
        if (receiver_.joinable()) {
            receiver_.request_stop();
            receiver_.join();
        }
        if (sender_.joinable()) sender_.join();
        if (conn_) conn_->close();
    });
}

std::expected<void, AsrError> WsStreamingSession::send_chunk(std::span<const uint8_t> pcm) {
    if (state_.load() != SessionState::Streaming) {
        return std::unexpected(AsrError::wire(
            std::format("{} session is not streaming ({})", provider_, to_string(state_.load()))));
    }
    return enqueue(Command{CommandKind::Audio, std::vector<uint8_t>(pcm.begin(), pcm.end())});
}

std::expected<void, AsrError> WsStreamingSession::commit() {
    if (state_.load() != SessionState::Streaming) {
        return std::unexpected(AsrError::wire(provider_ + " session is not streaming"));
    }
    return enqueue(Command{CommandKind::Commit, {}});
}

std::expected<void, AsrError> WsStreamingSession::enqueue(Command cmd) {
    switch (commands_.try_push(std::move(cmd))) {
        case PushStatus::Ok:
            return {};
        case PushStatus::Full:
            return std::unexpected(AsrError::wire(std::format(
                "{} send queue full ({} commands pending)", provider_, commands_.capacity())));
        case PushStatus::Closed:
            break;
    }
    return std::unexpected(AsrError::wire(provider_ + " send channel closed"));
}

std::expected<std::string, AsrError> WsStreamingSession::close() {
    if (close_called_.exchange(true)) {
        return std::unexpected(AsrError::internal("session already closed"));
    }

    state_.store(SessionState::Finishing);
    // One deadline covers both queueing the finish signal and the final answer.
    auto deadline = std::chrono::steady_clock::now() + close_timeout_;
    switch (commands_.push_until(Command{CommandKind::Finish, {}}, deadline)) {
        case PushStatus::Ok:
            break;
        case PushStatus::Full:
            logging::warn("{}: send queue still full, finish not sent", provider_);
            break;
        case PushStatus::Closed:
            logging::debug("{}: sender already stopped, finish not sent", provider_);
            break;
    }
    commands_.close();

    std::expected<std::string, AsrError> result =
        std::unexpected(AsrError::timeout(static_cast<uint64_t>(close_timeout_.count())));
    if (result_future_.wait_until(deadline) == std::future_status::ready) {
        result = result_future_.get();
    } else {
        logging::warn("{}: no final result within {}ms", provider_, close_timeout_.count());
    }

    shutdown();
    state_.store(result ? SessionState::Closed : SessionState::Failed);
    return result;
}

void WsStreamingSession::set_partial_callback(PartialCallback callback) {
    std::lock_guard lock(callback_mu_);
    partial_callback_ = std::move(callback);
}

void WsStreamingSession::resolve(std::expected<std::string, AsrError> result) {
    std::lock_guard lock(result_mu_);
    if (resolved_.load()) return;
    resolved_.store(true);
    result_promise_.set_value(std::move(result));
}

void WsStreamingSession::emit_partial(const std::string& text) {
    PartialCallback cb;
    {
        std::lock_guard lock(callback_mu_);
        cb = partial_callback_;
    }
    if (cb) cb(text);
}

void WsStreamingSession::sender_loop() {
    while (auto cmd = commands_.pop()) {
        switch (cmd->kind) {
            case CommandKind::Audio:
                if (auto r = write_audio(cmd->pcm); !r) {
                    logging::error("{}: audio send failed: {}", provider_, r.error());
                    commands_.close();
                    return;
                }
                break;
            case CommandKind::Commit:
                if (auto r = write_commit(); !r) {
                    logging::warn("{}: commit failed: {}", provider_, r.error());
                }
                break;
            case CommandKind::Finish:
                if (auto r = write_finish(); !r) {
                    logging::warn("{}: finish failed: {}", provider_, r.error());
                }
                return;
        }
    }
}

void WsStreamingSession::receiver_loop(std::stop_token stop) {
    while (!stop.stop_requested() && !resolved()) {
        auto msg = conn_->receive(kReceivePoll);
        if (!msg) {
            on_disconnect(msg.error());
            return;
        }
        if (!*msg) continue;
        if ((*msg)->type == WsMessage::Type::Close) {
            on_disconnect("connection closed by server");
            return;
        }
        on_message(**msg);
    }
}
