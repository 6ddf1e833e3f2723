#include "sequential_strategy.hpp"

#include "../logging.hpp"

std::expected<TranscriptionResult, AsrError> SequentialStrategy::transcribe(const AudioBuffer& audio) {
    if (auto ok = check_audio(audio); !ok) return std::unexpected(ok.error());

    auto start = Clock::now();
    auto run = run_primary(audio);

    switch (run.outcome) {
        case PrimaryRun::Outcome::Succeeded:
            return succeed(std::move(run.text), *primary_, false, start);
        case PrimaryRun::Outcome::FailedFast:
            return std::unexpected(*run.fatal);
        case PrimaryRun::Outcome::Exhausted:
        case PrimaryRun::Outcome::Preempted:
            break;
    }

    if (!is_fallback_enabled()) {
        return std::unexpected(all_failed(run.errors, std::nullopt));
    }

    logging::info("primary {} exhausted, trying fallback {}", primary_->name(), fallback_->name());
    auto result = fallback_->transcribe(audio);
    if (!result) {
        logging::warn("fallback {} failed: {}", fallback_->name(), result.error().to_string());
        return std::unexpected(all_failed(run.errors, result.error().to_string()));
    }
    return succeed(std::move(*result), *fallback_, true, start);
}
