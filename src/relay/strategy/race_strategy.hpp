#pragma once

#include "transcription_strategy.hpp"

// As ParallelStrategy, but a successful fallback seen between primary
// attempts ends the call early. The fallback is only checked at those
// checkpoints, never while a primary attempt is in flight.
class RaceStrategy : public TranscriptionStrategy {
public:
    using TranscriptionStrategy::TranscriptionStrategy;

    StrategyKind kind() const override { return StrategyKind::Race; }
    std::expected<TranscriptionResult, AsrError> transcribe(const AudioBuffer& audio) override;
};
