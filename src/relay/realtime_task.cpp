#include "realtime_task.hpp"

#include "logging.hpp"

#include <chrono>
#include <format>
#include <utility>

RealtimeTranscriptionTask::RealtimeTranscriptionTask(ProviderConfig config,
                                                     std::shared_ptr<ChunkChannel> chunks,
                                                     StreamingSession::PartialCallback on_partial,
                                                     EngineDeps deps)
    : config_(std::move(config)),
      deps_(std::move(deps)),
      chunks_(std::move(chunks)),
      on_partial_(std::move(on_partial)) {}

RealtimeTranscriptionTask::RealtimeTranscriptionTask(std::shared_ptr<AsrEngine> engine,
                                                     std::shared_ptr<ChunkChannel> chunks,
                                                     StreamingSession::PartialCallback on_partial)
    : engine_(std::move(engine)), chunks_(std::move(chunks)), on_partial_(std::move(on_partial)) {}

std::expected<std::shared_ptr<AsrEngine>, AsrError> RealtimeTranscriptionTask::resolve_engine() {
    if (engine_) return engine_;
    logging::info("realtime: provider {}, mode {}", to_string(config_->provider),
                  to_string(config_->mode));
    auto engine = create_engine(*config_, RetryPolicy{}, deps_);
    if (!engine) return std::unexpected(engine.error());
    engine_ = std::move(*engine);
    return engine_;
}

RealtimeTaskResult RealtimeTranscriptionTask::run_with_details(std::stop_token stop) {
    auto start = std::chrono::steady_clock::now();
    std::string engine_name = "unknown";
    uint64_t chunks_sent = 0;
    uint64_t samples_sent = 0;

    auto fail = [&](AsrError error) {
        return std::unexpected(RealtimeTaskFailure{
            .error = std::move(error),
            .engine_name = engine_name,
            .chunks_sent = chunks_sent,
            .samples_sent = samples_sent,
        });
    };

    auto engine = resolve_engine();
    if (!engine) {
        logging::error("realtime: engine creation failed: {}", engine.error().to_string());
        return fail(engine.error());
    }
    engine_name = std::string((*engine)->name());

    auto session = (*engine)->create_realtime_session();
    if (!session) {
        logging::error("realtime: {} session failed to open: {}", engine_name,
                       session.error().to_string());
        return fail(session.error());
    }
    logging::info("realtime: {} session open", engine_name);

    if (on_partial_) (*session)->set_partial_callback(on_partial_);

    uint32_t consecutive_failures = 0;
    while (auto chunk = chunks_->pop(stop)) {
        ++chunks_sent;
        samples_sent += chunk->samples.size();

        auto bytes = pcm::to_bytes(chunk->samples);
        if (auto r = (*session)->send_chunk(bytes); r) {
            consecutive_failures = 0;
        } else {
            ++consecutive_failures;
            logging::warn("realtime: chunk send failed ({}/{}): {}", consecutive_failures,
                          kMaxConsecutiveSendFailures, r.error().to_string());
            if (consecutive_failures >= kMaxConsecutiveSendFailures) {
                logging::error("realtime: too many consecutive send failures, aborting");
                return fail(AsrError::wire(
                    std::format("{} consecutive send failures after {} chunks ({} samples): {}",
                                consecutive_failures, chunks_sent, samples_sent,
                                r.error().message)));
            }
        }

        if (chunks_sent % 10 == 0) {
            logging::debug("realtime: sent {} chunks, {} samples", chunks_sent, samples_sent);
        }
    }

    if (stop.stop_requested()) {
        logging::info("realtime: stop requested, closing session");
    } else {
        logging::info("realtime: chunk source closed");
    }
    logging::info("realtime: sent {} chunks, {} samples (~{:.1f}s)", chunks_sent, samples_sent,
                  static_cast<double>(samples_sent) / 16000.0);

    auto text = (*session)->close();
    if (!text) {
        logging::error("realtime: {} close failed: {}", engine_name, text.error().to_string());
        return fail(text.error());
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    logging::info("realtime: {} finished in {}ms", engine_name, elapsed.count());
    return TranscriptionResult{
        .text = std::move(*text),
        .engine_name = engine_name,
        .used_fallback = false,
        .elapsed = elapsed,
    };
}

std::expected<TranscriptionResult, AsrError> RealtimeTranscriptionTask::run(std::stop_token stop) {
    auto result = run_with_details(stop);
    if (!result) {
        const auto& f = result.error();
        logging::error("realtime: engine={} chunks={} samples={} error={}", f.engine_name,
                       f.chunks_sent, f.samples_sent, f.error.to_string());
        return std::unexpected(f.error);
    }
    return std::move(*result);
}

RealtimeTaskResult RealtimeHandle::wait() {
    auto result = result_.get();
    if (worker_.joinable()) worker_.join();
    return result;
}

bool RealtimeHandle::finished() const {
    return result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

RealtimeStart start_realtime(RealtimeTranscriptionTask task) {
    std::promise<RealtimeTaskResult> promise;
    auto future = promise.get_future();
    std::jthread worker([task = std::move(task), promise = std::move(promise)](
                            std::stop_token stop) mutable {
        promise.set_value(task.run_with_details(stop));
    });
    auto stop = worker.get_stop_source();
    return RealtimeStart{
        .handle = RealtimeHandle(std::move(future), std::move(worker)),
        .stop = std::move(stop),
    };
}

RealtimeStart start_realtime(ProviderConfig config, std::shared_ptr<ChunkChannel> chunks,
                             StreamingSession::PartialCallback on_partial, EngineDeps deps) {
    return start_realtime(RealtimeTranscriptionTask(std::move(config), std::move(chunks),
                                                    std::move(on_partial), std::move(deps)));
}
