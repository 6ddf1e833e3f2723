#pragma once

#include "audio/audio_buffer.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "engine.hpp"
#include "engine_factory.hpp"

#include <cstdint>
#include <expected>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

struct RealtimeTaskFailure {
    AsrError error;
    std::string engine_name;
    uint64_t chunks_sent = 0;
    uint64_t samples_sent = 0;
};

using RealtimeTaskResult = std::expected<TranscriptionResult, RealtimeTaskFailure>;
using ChunkChannel = Channel<AudioChunk>;

// Forwards an ordered chunk stream into one streaming session and returns
// the session's final text. Stops when the channel closes or on a stop
// request, checked between chunks.
class RealtimeTranscriptionTask {
public:
    static constexpr uint32_t kMaxConsecutiveSendFailures = 5;

    // The engine is created from config when the task runs.
    RealtimeTranscriptionTask(ProviderConfig config, std::shared_ptr<ChunkChannel> chunks,
                              StreamingSession::PartialCallback on_partial = {},
                              EngineDeps deps = default_engine_deps());
    RealtimeTranscriptionTask(std::shared_ptr<AsrEngine> engine, std::shared_ptr<ChunkChannel> chunks,
                              StreamingSession::PartialCallback on_partial = {});

    RealtimeTaskResult run_with_details(std::stop_token stop = {});
    std::expected<TranscriptionResult, AsrError> run(std::stop_token stop = {});

private:
    std::expected<std::shared_ptr<AsrEngine>, AsrError> resolve_engine();

    std::optional<ProviderConfig> config_;
    EngineDeps deps_;
    std::shared_ptr<AsrEngine> engine_;
    std::shared_ptr<ChunkChannel> chunks_;
    StreamingSession::PartialCallback on_partial_;
};

// Running task. Destroying the handle requests a graceful stop and joins.
class RealtimeHandle {
public:
    RealtimeHandle(std::future<RealtimeTaskResult> result, std::jthread worker)
        : result_(std::move(result)), worker_(std::move(worker)) {}

    // Blocks until the task has closed its session.
    RealtimeTaskResult wait();
    bool finished() const;

private:
    std::future<RealtimeTaskResult> result_;
    std::jthread worker_;
};

struct RealtimeStart {
    RealtimeHandle handle;
    // request_stop() ends the chunk loop and closes the session.
    std::stop_source stop;
};

RealtimeStart start_realtime(RealtimeTranscriptionTask task);
RealtimeStart start_realtime(ProviderConfig config, std::shared_ptr<ChunkChannel> chunks,
                             StreamingSession::PartialCallback on_partial = {},
                             EngineDeps deps = default_engine_deps());
