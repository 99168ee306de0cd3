#pragma once

#include <atomic>
#include <cstdio>
#include <format>
#include <print>
#include <utility>

// stderr logging shared by the asr-stream binaries.
// Level 0 prints warnings and errors, -v adds info, -vv adds per-frame debug.
namespace logging {

inline std::atomic<int>& level_ref() {
    static std::atomic<int> level{0};
    return level;
}

inline void set_verbosity(int level) {
    level_ref().store(level, std::memory_order_relaxed);
}

inline int verbosity() {
    return level_ref().load(std::memory_order_relaxed);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (verbosity() < 2) return;
    std::println(stderr, "[asr-stream] debug: {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (verbosity() < 1) return;
    std::println(stderr, "[asr-stream] {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    std::println(stderr, "[asr-stream] warning: {}", std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    std::println(stderr, "[asr-stream] error: {}", std::format(fmt, std::forward<Args>(args)...));
}

} // namespace logging
