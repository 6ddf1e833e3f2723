#pragma once

#include "transcription_strategy.hpp"

// Fallback starts in the background alongside the primary. Its answer is
// only used once the primary has given up.
class ParallelStrategy : public TranscriptionStrategy {
public:
    using TranscriptionStrategy::TranscriptionStrategy;

    StrategyKind kind() const override { return StrategyKind::Parallel; }
    std::expected<TranscriptionResult, AsrError> transcribe(const AudioBuffer& audio) override;
};
