#pragma once

#include "../audio/audio_buffer.hpp"
#include "../config.hpp"
#include "../engine.hpp"
#include "../engine_factory.hpp"
#include "../retry_policy.hpp"

#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Primary engine with an optional fallback, composed into one transcribe().
class TranscriptionStrategy {
public:
    TranscriptionStrategy(std::shared_ptr<AsrEngine> primary, std::shared_ptr<AsrEngine> fallback,
                          bool enable_fallback, RetryPolicy retry);
    virtual ~TranscriptionStrategy() = default;

    virtual StrategyKind kind() const = 0;
    virtual std::expected<TranscriptionResult, AsrError> transcribe(const AudioBuffer& audio) = 0;

    std::string_view primary_name() const { return primary_->name(); }
    std::optional<std::string_view> fallback_name() const;
    bool is_fallback_enabled() const { return enable_fallback_ && fallback_ != nullptr; }
    const RetryPolicy& retry_policy() const { return retry_; }

protected:
    using Clock = std::chrono::steady_clock;

    struct PrimaryRun {
        enum class Outcome {
            Succeeded,
            // Retries used up, or a non-retryable error that still allows fallback.
            Exhausted,
            // Structural error: no retry, no fallback.
            FailedFast,
            // The checkpoint asked to abandon the primary.
            Preempted,
        };
        Outcome outcome = Outcome::Exhausted;
        std::string text;
        std::vector<std::string> errors;
        std::optional<AsrError> fatal;
    };

    // Called before each retry delay. Returning true abandons the primary.
    using Checkpoint = std::function<bool()>;

    PrimaryRun run_primary(const AudioBuffer& audio, const Checkpoint& checkpoint = {});

    TranscriptionResult succeed(std::string text, const AsrEngine& engine, bool used_fallback,
                                Clock::time_point start) const;
    static AsrError all_failed(const std::vector<std::string>& primary_errors,
                               std::optional<std::string> fallback_error);
    static std::expected<void, AsrError> check_audio(const AudioBuffer& audio);

    std::shared_ptr<AsrEngine> primary_;
    std::shared_ptr<AsrEngine> fallback_;
    bool enable_fallback_;
    RetryPolicy retry_;
};

// Builds the engines named by the config and wraps them in the configured
// strategy. Engine creation failures surface here, before any audio is sent.
std::expected<std::unique_ptr<TranscriptionStrategy>, AsrError>
make_strategy(const AsrConfig& config, const EngineDeps& deps);
std::expected<std::unique_ptr<TranscriptionStrategy>, AsrError>
make_strategy(const AsrConfig& config);
