// ============================================================================
// paratask/core/log.hpp - Leveled Logging
// ============================================================================
//
// Messages are formatted with {fmt} and handed to a process-wide sink. The
// default sink writes one line per message to stderr:
//
//   [paratask] [error] Exception running task [fetch]: connection refused
//
// Formatting only happens when the level is enabled, so debug statements on
// the pipeline hot path cost one atomic load when disabled.
//
// USAGE:
// ------
//   PARATASK_LOG_ERROR("Exception executing callback for [{}]: {}", name, what);
//
//   SetLogLevel(LogLevel::Debug);
//   SetLogSink([](LogLevel level, std::string_view line) { capture(line); });
//
// ============================================================================

#pragma once

#include <fmt/format.h>

#include <functional>
#include <string>
#include <string_view>
#include <utility>

namespace paratask {

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error,
    Off,
};

using LogSink = std::function<void(LogLevel level, std::string_view message)>;

std::string_view ToString(LogLevel level) noexcept;

// Replace the sink. An empty function restores the stderr sink.
void SetLogSink(LogSink sink);

void SetLogLevel(LogLevel level) noexcept;

[[nodiscard]] LogLevel GetLogLevel() noexcept;

[[nodiscard]] inline bool ShouldLog(LogLevel level) noexcept {
    return level != LogLevel::Off && level >= GetLogLevel();
}

namespace detail {

void EmitLog(LogLevel level, std::string message);

template <typename... Args>
void Log(LogLevel level, fmt::format_string<Args...> format, Args&&... args) {
    if (!ShouldLog(level)) {
        return;
    }
    EmitLog(level, fmt::format(format, std::forward<Args>(args)...));
}

}  // namespace detail

}  // namespace paratask

#define PARATASK_LOG_DEBUG(...) ::paratask::detail::Log(::paratask::LogLevel::Debug, __VA_ARGS__)
#define PARATASK_LOG_INFO(...) ::paratask::detail::Log(::paratask::LogLevel::Info, __VA_ARGS__)
#define PARATASK_LOG_WARN(...) ::paratask::detail::Log(::paratask::LogLevel::Warn, __VA_ARGS__)
#define PARATASK_LOG_ERROR(...) ::paratask::detail::Log(::paratask::LogLevel::Error, __VA_ARGS__)
