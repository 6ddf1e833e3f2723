#pragma once

#include <atomic>
#include <format>
#include <print>
#include <string_view>
#include <utility>

// stderr logging, one "[asr-relay] [level] message" line per call.
// debug/info are only printed in verbose mode; warn/error always are.
namespace logging {

inline std::atomic<bool>& verbose_flag() {
    static std::atomic<bool> flag{false};
    return flag;
}

inline void set_verbose(bool verbose) {
    verbose_flag().store(verbose, std::memory_order_relaxed);
}

inline bool verbose() {
    return verbose_flag().load(std::memory_order_relaxed);
}

inline void write(std::string_view level, std::string_view msg) {
    std::println(stderr, "[asr-relay] [{}] {}", level, msg);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (verbose()) write("debug", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (verbose()) write("info", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    write("warn", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    write("error", std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
