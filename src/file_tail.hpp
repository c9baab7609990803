#pragma once

#include "change_watcher.hpp"
#include "partition_mapper.hpp"
#include "read_lane.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace map_tail {

enum class SessionState : int {
    Idle = 0,
    Reading = 1,
    Watching = 2,
    Stopped = 3
};

inline std::string session_state_to_string(SessionState s) {
    switch (s) {
        case SessionState::Idle: return "Idle";
        case SessionState::Reading: return "Reading";
        case SessionState::Watching: return "Watching";
        case SessionState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

// Tails the last lines of one file. Every read (the initial one and each one
// triggered by the watcher) runs on a single serial lane, so batches reach the
// consumer one at a time in trigger order.
class FileTail {
public:
    using LineFeed = std::function<void(std::vector<std::string> lines)>;
    using LineCountPolicy = std::function<std::size_t()>;
    using ErrorReporter = std::function<void(const std::string& message)>;
    using DoneCallback = std::function<void(bool ok)>;

    // Throws ConfigurationError unless 0 < partition_size <= max_bytes
    FileTail(const std::string& path, LineFeed line_feed, LineCountPolicy max_lines,
             ErrorReporter reporter, std::uint64_t max_bytes, std::uint64_t partition_size);
    FileTail(const std::string& path, LineFeed line_feed, LineCountPolicy max_lines,
             ErrorReporter reporter);
    ~FileTail();

    // Non-copyable
    FileTail(const FileTail&) = delete;
    FileTail& operator=(const FileTail&) = delete;

    // Performs the initial read, starts watching if it succeeded, then calls
    // on_done exactly once with the outcome. follow=false skips the watcher.
    void start(DoneCallback on_done, bool follow = true);

    // Idempotent, terminal
    void stop();

    // Queue one more read on the lane, as a watch event would
    void refresh();

    SessionState state() const { return state_; }
    const std::string& path() const { return path_; }

    // Reads that ran to completion (delivered or not), for diagnostics
    std::uint64_t completed_reads() const { return completed_reads_; }

private:
    void on_file_changed();
    void triggered_read();
    bool read_once();
    std::vector<std::string> read_lines(std::size_t wanted);
    void report(const std::string& message);
    void set_state(SessionState next);
    DoneCallback take_done();

    const std::string path_;
    LineFeed line_feed_;
    LineCountPolicy max_lines_;
    ErrorReporter reporter_;
    PartitionMapper mapper_;

    ReadLane lane_;
    ChangeWatcher watcher_;
    std::mutex watcher_mutex_;

    // on_done of a start() whose initial read has not begun yet
    DoneCallback pending_done_;
    std::mutex done_mutex_;

    std::atomic<SessionState> state_{SessionState::Idle};
    std::atomic<bool> started_{false};
    std::atomic<bool> closed_{false};
    std::atomic<std::uint64_t> completed_reads_{0};
};

} // namespace map_tail
