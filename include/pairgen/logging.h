#pragma once
/*
===============================================================================
LOGGING — Process-wide diagnostic log for pairgen
===============================================================================

Overview
--------
A small leveled logger shared by every generator. Algorithms report warnings
(dropped seeds, degraded combinations), informational summaries (tables
produced, rules propagated) and debug traces (candidate queue sizes, jumps)
through it. Messages below the configured threshold are discarded before any
formatting happens on the caller side (check enabled() first).

Key Components
--------------
• LogLevel  — Trace, Debug, Info, Warn, Error, Off
• LogSink   — std::function receiving (level, message)
• Logger    — threshold + sink, noexcept log()
• logger()  — the process-wide instance

Output Policy
-------------
The default sink writes "[pairgen] LEVEL: message" lines to std::cerr. The
default threshold is Warn, or Debug when built with PAIRGEN_DEBUG / _DEBUG.

Typical Usage
-------------
    pairgen::logger().setLevel(pairgen::LogLevel::Info);

    std::vector<std::string> captured;
    pairgen::logger().setSink([&](pairgen::LogLevel, const std::string& m) {
        captured.push_back(m);
    });
    ...
    pairgen::logger().resetSink();

Thread Safety
-------------
• The threshold is atomic
• Sink replacement and dispatch are serialized by one mutex, so a sink never
  runs concurrently with itself

Exception Safety
----------------
• log() never throws. A sink throwing std::exception is reported on std::cerr and the
  message is written there instead.

===============================================================================
*/

#include <atomic>
#include <cctype>
#include <functional>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>

#include "enum_utils.h"
#include "naming.h"

namespace pairgen {

PAIRGEN_DECLARE_ENUM_WITH_COUNT(LogLevel, Trace, Debug, Info, Warn, Error, Off)

/// Receives every message at or above the logger threshold
using LogSink = std::function<void(LogLevel, const std::string&)>;

// =============================================================================
// LOGGER
// =============================================================================

class Logger {
public:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void setLevel(LogLevel level) noexcept {
        level_.store(level, std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return level_.load(std::memory_order_relaxed);
    }

    /// @brief True if a message at `level` would be dispatched
    bool enabled(LogLevel level) const noexcept {
        return level != LogLevel::Off && level >= this->level();
    }

    /**
     * @brief Replace the output sink
     * @note Passing an empty function restores the default sink
     */
    void setSink(LogSink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    void resetSink() {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = nullptr;
    }

    /**
     * @brief Dispatch a message
     *
     * @param level   Severity; Off is never dispatched
     * @param message Fully formatted text (without the "[pairgen]" prefix)
     */
    void log(LogLevel level, const std::string& message) noexcept {
        if (!enabled(level))
            return;
        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            try {
                sink_(level, message);
                return;
            } catch (const std::exception& e) {
                writeDefault(LogLevel::Error, naming::concat("log sink failed: ", e.what()));
            }
        }
        writeDefault(level, message);
    }

    /// @brief Convenience overloads
    void debug(const std::string& message) noexcept { log(LogLevel::Debug, message); }
    void info(const std::string& message) noexcept { log(LogLevel::Info, message); }
    void warn(const std::string& message) noexcept { log(LogLevel::Warn, message); }
    void error(const std::string& message) noexcept { log(LogLevel::Error, message); }

    /// @brief Text written by the default sink for one message
    static std::string format(LogLevel level, const std::string& message) {
        std::string line = "[pairgen] ";
        for (char c : enum_name(level))
            line.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        line.append(": ");
        line.append(message);
        return line;
    }

private:
    static void writeDefault(LogLevel level, const std::string& message) noexcept {
        try {
            std::cerr << format(level, message) << '\n';
        } catch (const std::exception&) {
            // Nothing left to report to
        }
    }

    std::atomic<LogLevel> level_{ debug_enabled() ? LogLevel::Debug : LogLevel::Warn };
    std::mutex mutex_;
    LogSink sink_;
};

/**
 * @brief The process-wide logger
 * @note Function-local static; initialization is thread-safe
 */
inline Logger& logger() {
    static Logger instance;
    return instance;
}

/// Sets the logger threshold for the lifetime of the guard, then restores it
class ScopedLogLevel {
public:
    explicit ScopedLogLevel(LogLevel level) noexcept
        : previous_(logger().level()) {
        logger().setLevel(level);
    }

    ~ScopedLogLevel() { logger().setLevel(previous_); }

    ScopedLogLevel(const ScopedLogLevel&) = delete;
    ScopedLogLevel& operator=(const ScopedLogLevel&) = delete;

private:
    LogLevel previous_;
};

} // namespace pairgen
