#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <format>
#include <string>

// Unique-per-process id for provider request/connect headers.
inline std::string make_request_id() {
    static std::atomic<uint32_t> counter{0};
    auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();
    return std::format("req_{}_{}", ns, counter.fetch_add(1, std::memory_order_relaxed));
}
