#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace map_tail {

enum class LogLevel {
    Debug,
    Info,
    Error
};

const char* log_level_to_string(LogLevel level);

// Diagnostics for the tail session. One sink at a time receives every
// message at or above the threshold; the viewer installs its own.
class TailLog {
public:
    using Sink = std::function<void(LogLevel level,
                                    const std::string& component,
                                    const std::string& message)>;

    static void set_sink(Sink sink);
    static void set_threshold(LogLevel level);
    static bool enabled(LogLevel level);

    static void write(LogLevel level, const std::string& component, const std::string& message);
    static void log(const std::string& component, const std::string& message) {
        write(LogLevel::Info, component, message);
    }
    static void error(const std::string& component, const std::string& message) {
        write(LogLevel::Error, component, message);
    }
    static void debug(const std::string& component, const std::string& message) {
        write(LogLevel::Debug, component, message);
    }

    // "[component] message", errors on stderr and the rest on stdout
    static void console_sink(LogLevel level, const std::string& component,
                             const std::string& message);
    // Everything on stderr, for when stdout carries tailed lines
    static void stderr_sink(LogLevel level, const std::string& component,
                            const std::string& message);

private:
    static Sink sink_;
    static std::mutex mutex_;
    static std::atomic<int> threshold_;
};

} // namespace map_tail
