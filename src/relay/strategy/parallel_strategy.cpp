#include "parallel_strategy.hpp"

#include "../logging.hpp"
#include "background_transcription.hpp"

std::expected<TranscriptionResult, AsrError> ParallelStrategy::transcribe(const AudioBuffer& audio) {
    if (auto ok = check_audio(audio); !ok) return std::unexpected(ok.error());

    auto start = Clock::now();
    std::unique_ptr<BackgroundTranscription> background;
    if (is_fallback_enabled()) {
        logging::debug("starting fallback {} in the background", fallback_->name());
        background = std::make_unique<BackgroundTranscription>(fallback_, audio);
    }

    auto run = run_primary(audio);

    switch (run.outcome) {
        case PrimaryRun::Outcome::Succeeded:
            if (background) background->cancel();
            return succeed(std::move(run.text), *primary_, false, start);
        case PrimaryRun::Outcome::FailedFast:
            if (background) background->cancel();
            return std::unexpected(*run.fatal);
        case PrimaryRun::Outcome::Exhausted:
        case PrimaryRun::Outcome::Preempted:
            break;
    }

    if (!background) {
        return std::unexpected(all_failed(run.errors, std::nullopt));
    }

    logging::info("primary {} exhausted, waiting for fallback {}", primary_->name(),
                  fallback_->name());
    auto result = background->wait();
    if (!result) {
        logging::warn("fallback {} failed: {}", fallback_->name(), result.error().to_string());
        return std::unexpected(all_failed(run.errors, result.error().to_string()));
    }
    return succeed(std::move(*result), *fallback_, true, start);
}
