#include "tail_log.hpp"
#include <iostream>

namespace map_tail {

TailLog::Sink TailLog::sink_ = TailLog::console_sink;
std::mutex TailLog::mutex_;
std::atomic<int> TailLog::threshold_{static_cast<int>(LogLevel::Info)};

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Error: return "error";
    }
    return "unknown";
}

namespace {

void format_line(std::ostream& out, LogLevel level, const std::string& component,
                 const std::string& message) {
    out << "[" << component << "] ";
    if (level != LogLevel::Info) {
        out << log_level_to_string(level) << ": ";
    }
    out << message << std::endl;
}

} // namespace

void TailLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : Sink(console_sink);
}

void TailLog::set_threshold(LogLevel level) {
    threshold_ = static_cast<int>(level);
}

bool TailLog::enabled(LogLevel level) {
    return static_cast<int>(level) >= threshold_.load();
}

void TailLog::write(LogLevel level, const std::string& component, const std::string& message) {
    if (!enabled(level)) return;
    std::lock_guard<std::mutex> lock(mutex_);
    sink_(level, component, message);
}

void TailLog::console_sink(LogLevel level, const std::string& component,
                           const std::string& message) {
    format_line(level == LogLevel::Error ? std::cerr : std::cout, level, component, message);
}

void TailLog::stderr_sink(LogLevel level, const std::string& component,
                          const std::string& message) {
    format_line(std::cerr, level, component, message);
}

} // namespace map_tail
