#pragma once

#include "transcription_strategy.hpp"

// Primary through its retry schedule, then the fallback once.
class SequentialStrategy : public TranscriptionStrategy {
public:
    using TranscriptionStrategy::TranscriptionStrategy;

    StrategyKind kind() const override { return StrategyKind::Sequential; }
    std::expected<TranscriptionResult, AsrError> transcribe(const AudioBuffer& audio) override;
};
