// ============================================================================
// paratask/core/log.cpp - Log Sink and Level
// ============================================================================

#include "paratask/core/log.hpp"

#include <fmt/format.h>

#include <atomic>
#include <cstdio>
#include <mutex>
#include <utility>

namespace paratask {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::Info};

// Guards the sink itself and serializes writes through it
std::mutex g_sink_mutex;
LogSink g_sink;

void WriteToStderr(LogLevel level, std::string_view message) {
    fmt::print(stderr, "[paratask] [{}] {}\n", ToString(level), message);
    std::fflush(stderr);
}

}  // namespace

std::string_view ToString(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
        case LogLevel::Off:
            return "off";
    }
    return "unknown";
}

void SetLogSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    g_sink = std::move(sink);
}

void SetLogLevel(LogLevel level) noexcept {
    g_log_level.store(level, std::memory_order_relaxed);
}

LogLevel GetLogLevel() noexcept {
    return g_log_level.load(std::memory_order_relaxed);
}

namespace detail {

void EmitLog(LogLevel level, std::string message) {
    std::lock_guard<std::mutex> lock(g_sink_mutex);
    if (g_sink) {
        g_sink(level, message);
    } else {
        WriteToStderr(level, message);
    }
}

}  // namespace detail

}  // namespace paratask
