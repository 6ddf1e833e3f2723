#include "background_transcription.hpp"

#include "../logging.hpp"

#include <utility>

BackgroundTranscription::BackgroundTranscription(std::shared_ptr<AsrEngine> engine,
                                                 AudioBuffer audio)
    : slot_(std::make_shared<Slot>()) {
    // The worker owns copies of everything it touches so it can outlive us
    // after cancel().
    worker_ = std::jthread([slot = slot_, engine = std::move(engine),
                            audio = std::move(audio)](std::stop_token stop) {
        auto result = engine->transcribe(audio, stop);
        if (stop.stop_requested()) {
            logging::debug("background {} call finished after cancel", engine->name());
        }
        {
            std::lock_guard lock(slot->mu);
            slot->result = std::move(result);
            slot->ready.store(true, std::memory_order_release);
        }
        slot->cv.notify_all();
    });
}

BackgroundTranscription::~BackgroundTranscription() {
    if (worker_.joinable()) cancel();
}

std::optional<BackgroundTranscription::Result> BackgroundTranscription::peek() const {
    if (cancelled_ || !slot_->ready.load(std::memory_order_acquire)) return std::nullopt;
    return *slot_->result;
}

BackgroundTranscription::Result BackgroundTranscription::wait() {
    if (cancelled_) {
        return std::unexpected(AsrError::internal("background transcription was cancelled"));
    }
    std::unique_lock lock(slot_->mu);
    slot_->cv.wait(lock, [this] { return slot_->ready.load(std::memory_order_acquire); });
    auto result = *slot_->result;
    lock.unlock();
    if (worker_.joinable()) worker_.join();
    return result;
}

void BackgroundTranscription::cancel() {
    if (cancelled_) return;
    cancelled_ = true;
    if (worker_.joinable()) {
        worker_.request_stop();
        worker_.detach();
    }
}
