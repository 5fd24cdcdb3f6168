#ifndef KINSHIP_LOG_HPP
#define KINSHIP_LOG_HPP

#include <atomic>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/format.h>
#include <magic_enum.hpp>

#include <kinship/meta/formatter.hpp>

namespace kin::log {

enum class Level : std::uint8_t { Trace, Debug, Info, Warning, Error, Off };

/// receives every message at or above the current threshold, already formatted
using Sink = std::function<void(Level, std::string_view)>;

namespace detail {
struct LoggerState {
    std::mutex         mutex;
    std::atomic<Level> threshold{Level::Info};
    Sink               sink;
};

inline LoggerState& state() {
    static LoggerState instance;
    return instance;
}

inline void writeToStderr(Level level, std::string_view message) { fmt::print(stderr, "{} [{}] {}\n", time::getIsoTime(), magic_enum::enum_name(level), message); }
} // namespace detail

inline void  setLevel(Level level) noexcept { detail::state().threshold.store(level, std::memory_order_relaxed); }
[[nodiscard]] inline Level level() noexcept { return detail::state().threshold.load(std::memory_order_relaxed); }
[[nodiscard]] inline bool  enabled(Level msgLevel) noexcept { return msgLevel != Level::Off && msgLevel >= level(); }

/**
 * @brief replaces the output sink, an empty `Sink` restores the default stderr writer
 * @return the previously installed sink (empty if it was the default)
 */
inline Sink setSink(Sink sink) {
    std::lock_guard lock(detail::state().mutex);
    return std::exchange(detail::state().sink, std::move(sink));
}

template<typename... Args>
void write(Level msgLevel, fmt::format_string<Args...> format, Args&&... args) {
    if (!enabled(msgLevel)) {
        return;
    }
    const std::string message = fmt::format(format, std::forward<Args>(args)...);
    Sink              sink;
    {
        std::lock_guard lock(detail::state().mutex);
        sink = detail::state().sink;
    }
    // the sink runs unlocked: it may log or replace itself
    if (sink) {
        sink(msgLevel, message);
    } else {
        detail::writeToStderr(msgLevel, message);
    }
}

template<typename... Args>
void trace(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Trace, format, std::forward<Args>(args)...);
}

template<typename... Args>
void debug(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Debug, format, std::forward<Args>(args)...);
}

template<typename... Args>
void info(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Info, format, std::forward<Args>(args)...);
}

template<typename... Args>
void warning(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Warning, format, std::forward<Args>(args)...);
}

template<typename... Args>
void error(fmt::format_string<Args...> format, Args&&... args) {
    write(Level::Error, format, std::forward<Args>(args)...);
}

} // namespace kin::log

#endif // KINSHIP_LOG_HPP
