#include "transcription_strategy.hpp"

#include "../engine_factory.hpp"
#include "../logging.hpp"
#include "parallel_strategy.hpp"
#include "race_strategy.hpp"
#include "sequential_strategy.hpp"

#include <format>
#include <thread>
#include <utility>

TranscriptionStrategy::TranscriptionStrategy(std::shared_ptr<AsrEngine> primary,
                                             std::shared_ptr<AsrEngine> fallback,
                                             bool enable_fallback, RetryPolicy retry)
    : primary_(std::move(primary)),
      fallback_(std::move(fallback)),
      enable_fallback_(enable_fallback),
      retry_(retry) {}

std::optional<std::string_view> TranscriptionStrategy::fallback_name() const {
    if (!fallback_) return std::nullopt;
    return fallback_->name();
}

std::expected<void, AsrError> TranscriptionStrategy::check_audio(const AudioBuffer& audio) {
    if (audio.empty()) {
        return std::unexpected(AsrError::invalid_audio("audio buffer is empty"));
    }
    return {};
}

TranscriptionStrategy::PrimaryRun
TranscriptionStrategy::run_primary(const AudioBuffer& audio, const Checkpoint& checkpoint) {
    PrimaryRun run;
    auto total = retry_.total_attempts();

    for (uint64_t attempt = 0; attempt < total; ++attempt) {
        if (attempt > 0) {
            if (checkpoint && checkpoint()) {
                run.outcome = PrimaryRun::Outcome::Preempted;
                return run;
            }
            auto delay = retry_.delay(attempt);
            logging::info("primary {} retry {}/{}, waiting {}ms", primary_->name(), attempt,
                          retry_.max_retries, delay.count());
            std::this_thread::sleep_for(delay);
        }

        auto result = primary_->transcribe(audio);
        if (result) {
            logging::info("primary {} succeeded (attempt {}/{})", primary_->name(), attempt + 1,
                          total);
            run.outcome = PrimaryRun::Outcome::Succeeded;
            run.text = std::move(*result);
            return run;
        }

        const auto& err = result.error();
        logging::warn("primary {} failed (attempt {}/{}): {}", primary_->name(), attempt + 1,
                      total, err.to_string());
        run.errors.push_back(std::format("{} attempt {}/{}: {}", primary_->name(), attempt + 1,
                                         total, err.to_string()));

        if (err.is_fail_fast()) {
            run.outcome = PrimaryRun::Outcome::FailedFast;
            run.fatal = err;
            return run;
        }
        if (!err.is_retryable()) {
            logging::info("primary {}: {} is not retryable", primary_->name(), to_string(err.kind));
            break;
        }
    }

    run.outcome = PrimaryRun::Outcome::Exhausted;
    return run;
}

TranscriptionResult TranscriptionStrategy::succeed(std::string text, const AsrEngine& engine,
                                                   bool used_fallback,
                                                   Clock::time_point start) const {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
    logging::info("{} engine {} answered in {}ms", used_fallback ? "fallback" : "primary",
                  engine.name(), elapsed.count());
    return TranscriptionResult{
        .text = std::move(text),
        .engine_name = std::string(engine.name()),
        .used_fallback = used_fallback,
        .elapsed = elapsed,
    };
}

AsrError TranscriptionStrategy::all_failed(const std::vector<std::string>& primary_errors,
                                           std::optional<std::string> fallback_error) {
    std::string joined;
    for (const auto& e : primary_errors) {
        if (!joined.empty()) joined += "; ";
        joined += e;
    }
    return AsrError::all_engines_failed(std::move(joined), std::move(fallback_error));
}

std::expected<std::unique_ptr<TranscriptionStrategy>, AsrError>
make_strategy(const AsrConfig& config, const EngineDeps& deps) {
    auto primary = create_engine(config.primary, config.retry, deps);
    if (!primary) return std::unexpected(primary.error());

    std::shared_ptr<AsrEngine> fallback;
    if (config.fallback) {
        auto engine = create_engine(*config.fallback, config.retry, deps);
        if (!engine) return std::unexpected(engine.error());
        fallback = std::move(*engine);
    }

    std::shared_ptr<AsrEngine> primary_engine = std::move(*primary);
    logging::debug("strategy: {} (primary={}, fallback={}, enabled={})", to_string(config.strategy),
                   primary_engine->name(), fallback ? fallback->name() : "none",
                   config.enable_fallback);

    switch (config.strategy) {
        case StrategyKind::Sequential:
            return std::make_unique<SequentialStrategy>(std::move(primary_engine), std::move(fallback),
                                                        config.enable_fallback, config.retry);
        case StrategyKind::Parallel:
            return std::make_unique<ParallelStrategy>(std::move(primary_engine), std::move(fallback),
                                                      config.enable_fallback, config.retry);
        case StrategyKind::Race:
            return std::make_unique<RaceStrategy>(std::move(primary_engine), std::move(fallback),
                                                  config.enable_fallback, config.retry);
    }
    return std::unexpected(AsrError::config("unknown strategy"));
}

std::expected<std::unique_ptr<TranscriptionStrategy>, AsrError>
make_strategy(const AsrConfig& config) {
    return make_strategy(config, default_engine_deps());
}
