#pragma once

#include "../channel.hpp"
#include "../engine.hpp"
#include "../net/ws_connection.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Streaming session over one websocket: a sender thread drains a command
// queue while a receiver thread parses server messages. Subclasses supply the
// provider framing and decide when the result is resolved.
//
// Subclass destructors must call shutdown() so the worker threads stop
// before the subclass hooks go away.
class WsStreamingSession : public StreamingSession {
public:
    static constexpr std::chrono::milliseconds kDefaultCloseTimeout{10000};
    // Audio commands queued ahead of a slow socket before send_chunk reports back-pressure.
    static constexpr size_t kSendQueueCapacity = 100;

    ~WsStreamingSession() override;

    std::expected<void, AsrError> send_chunk(std::span<const uint8_t> pcm) override;
    std::expected<void, AsrError> commit() override;
    std::expected<std::string, AsrError> close() override;
    void set_partial_callback(PartialCallback callback) override;
    SessionState state() const override { return state_.load(); }

protected:
    WsStreamingSession(std::string provider, std::unique_ptr<WsConnection> conn,
                       std::chrono::milliseconds close_timeout);

    // Handshake is done on the calling thread; this spawns the workers and
    // moves the session to Streaming.
    void start();
    void shutdown();

    WsConnection& connection() { return *conn_; }
    const std::string& provider() const { return provider_; }
    void set_state(SessionState state) { state_.store(state); }

    // Resolves the session result. Only the first call has any effect.
    void resolve(std::expected<std::string, AsrError> result);
    bool resolved() const { return resolved_.load(); }
    void emit_partial(const std::string& text);

    // Sender thread.
    virtual std::expected<void, std::string> write_audio(std::span<const uint8_t> pcm) = 0;
    virtual std::expected<void, std::string> write_commit() { return {}; }
    virtual std::expected<void, std::string> write_finish() = 0;

    // Receiver thread.
    virtual void on_message(const WsMessage& msg) = 0;
    virtual void on_disconnect(const std::string& reason) = 0;

private:
    enum class CommandKind { Audio, Commit, Finish };
    struct Command {
        CommandKind kind;
        std::vector<uint8_t> pcm;
    };

    std::expected<void, AsrError> enqueue(Command cmd);
    void sender_loop();
    void receiver_loop(std::stop_token stop);

    std::string provider_;
    std::unique_ptr<WsConnection> conn_;
    std::chrono::milliseconds close_timeout_;
    std::atomic<SessionState> state_{SessionState::Connecting};

    Channel<Command> commands_{kSendQueueCapacity};

    std::mutex result_mu_;
    std::atomic<bool> resolved_{false};
    std::promise<std::expected<std::string, AsrError>> result_promise_;
    std::future<std::expected<std::string, AsrError>> result_future_;
    std::atomic<bool> close_called_{false};

    std::mutex callback_mu_;
    PartialCallback partial_callback_;

    std::once_flag shutdown_once_;
    std::jthread sender_;
    std::jthread receiver_;
};
