#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>

// Pure exponential backoff, no jitter.
struct RetryPolicy {
    // Upper bound accepted from config; 2^29 * base_delay is already days.
    static constexpr uint32_t kMaxRetries = 30;

    uint32_t max_retries = 2;
    std::chrono::milliseconds base_delay{500};
    // Per-attempt network timeout, applied by each engine.
    std::chrono::milliseconds timeout{6000};

    uint64_t total_attempts() const { return uint64_t{max_retries} + 1; }

    // Delay before attempt k (0-based); attempt 0 starts immediately.
    // Saturates at milliseconds::max() instead of overflowing.
    std::chrono::milliseconds delay(uint64_t attempt) const {
        if (attempt == 0 || base_delay.count() <= 0) return std::chrono::milliseconds{0};
        auto shift = std::min<uint64_t>(attempt - 1, 62);
        int64_t factor = int64_t{1} << shift;
        int64_t base = base_delay.count();
        if (base > std::numeric_limits<int64_t>::max() / factor) {
            return std::chrono::milliseconds::max();
        }
        return std::chrono::milliseconds{base * factor};
    }
};
