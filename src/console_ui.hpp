#pragma once

#include "file_tail.hpp"
#include "line_budget.hpp"
#include "tail_config.hpp"
#include "tail_log.hpp"
#include <ftxui/component/screen_interactive.hpp>
#include <atomic>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace map_tail {

class ConsoleUI;

// Slash command typed into the bottom bar, e.g. "/lines 200"
struct SlashCommand {
    std::string name;
    std::vector<std::string> aliases;
    std::string usage;
    std::string description;
    std::function<void(ConsoleUI&, const std::vector<std::string>&)> handler;

    bool answers_to(const std::string& word) const;
};

// Entry captured from TailLog
struct TailLogLine {
    LogLevel level;
    std::string component;
    std::string message;
};

// Bounded, thread-safe history for the log pane
class LogHistory {
public:
    explicit LogHistory(size_t capacity) : capacity_(capacity) {}
    void push(TailLogLine line);
    std::vector<TailLogLine> recent(size_t count) const;
    size_t size() const;
private:
    mutable std::mutex mutex_;
    std::deque<TailLogLine> lines_;
    size_t capacity_;
};

// Full-screen viewer for one FileTail session
class ConsoleUI {
public:
    ConsoleUI(const TailConfig& config, LineBudget& budget);

    // Session shown in the status bar and refreshed on budget changes
    void attach(FileTail* tail) { tail_ = tail; }

    // Blocks until /quit or until running turns false
    void run(std::atomic<bool>& running);

    // Line feed: replaces the displayed batch
    void on_lines(std::vector<std::string> lines);

    // Error reporter: shows a banner until dismissed
    void report_error(const std::string& message);

    void log_message(const std::string& component, const std::string& message,
                     LogLevel level = LogLevel::Info);
    TailLog::Sink get_log_sink();

    std::vector<std::string> snapshot() const;
    std::string error_banner() const;
    void clear_error();

    // Change the line budget and queue a re-read
    void set_max_lines(size_t lines);

private:
    void refresh_screen();
    void toggle_pause();
    void show_help();

    void init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen);
    void execute_command();
    std::vector<std::string> matching_commands(const std::string& prefix) const;
    void complete_command();
    void update_completion_hint();

    const TailConfig& config_;
    LineBudget& budget_;
    FileTail* tail_ = nullptr;

    mutable std::mutex lines_mutex_;
    std::vector<std::string> lines_;
    std::vector<std::string> pending_;  // Latest batch received while paused
    bool has_pending_ = false;
    std::atomic<bool> paused_{false};
    std::atomic<uint64_t> batches_{0};

    mutable std::mutex error_mutex_;
    std::string error_;

    LogHistory history_;

    std::string command_input_;
    std::string completion_hint_;
    std::vector<SlashCommand> commands_;

    std::atomic<ftxui::ScreenInteractive*> screen_{nullptr};
};

} // namespace map_tail
