#pragma once

#include "../audio/audio_buffer.hpp"
#include "../engine.hpp"

#include <atomic>
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

// One engine call running on its own thread. The result slot is written once
// by the worker and published through an atomic flag, so peek() never blocks.
class BackgroundTranscription {
public:
    using Result = std::expected<std::string, AsrError>;

    BackgroundTranscription(std::shared_ptr<AsrEngine> engine, AudioBuffer audio);
    ~BackgroundTranscription();

    BackgroundTranscription(const BackgroundTranscription&) = delete;
    BackgroundTranscription& operator=(const BackgroundTranscription&) = delete;

    // The result if the worker has finished, without waiting.
    std::optional<Result> peek() const;

    // Blocks until the worker finishes.
    Result wait();

    // Requests the in-flight call to abort and abandons the worker. The
    // result is never read after this.
    void cancel();

    bool cancelled() const { return cancelled_; }

private:
    struct Slot {
        std::mutex mu;
        std::condition_variable cv;
        std::atomic<bool> ready{false};
        std::optional<Result> result;
    };

    std::shared_ptr<Slot> slot_;
    std::jthread worker_;
    bool cancelled_ = false;
};
