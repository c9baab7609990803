#pragma once

#include <asio.hpp>
#include <sys/inotify.h>
#include <climits>
#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace map_tail {

struct WatchEvent {
    std::uint32_t mask = 0;
    std::string name;   // Entry name relative to the watched directory
};

// Watches the parent directory of a file with inotify and reports
// modifications of that one file name. Events are read on a dedicated thread
// running its own io_context.
class ChangeWatcher {
public:
    using Callback = std::function<void()>;

    static constexpr std::uint32_t WATCH_MASK = IN_MODIFY | IN_CREATE | IN_MOVED_TO;

    ChangeWatcher(const std::string& path, Callback on_change);
    ~ChangeWatcher();

    // Non-copyable
    ChangeWatcher(const ChangeWatcher&) = delete;
    ChangeWatcher& operator=(const ChangeWatcher&) = delete;

    // Throws WatchError when the watch cannot be established
    void start();

    // Idempotent; closes the descriptor and joins the watcher thread
    void stop();

    bool is_running() const { return running_; }
    const std::string& directory() const { return directory_; }
    const std::string& file_name() const { return file_name_; }

    // Decode a buffer of raw inotify_event records
    static std::vector<WatchEvent> parse_events(const char* buffer, std::size_t length);

private:
    void start_read();
    void handle_read(const asio::error_code& error, std::size_t bytes_read);
    bool is_relevant(const WatchEvent& event) const;

    std::string directory_;
    std::string file_name_;
    Callback on_change_;

    asio::io_context io_context_;
    asio::posix::stream_descriptor descriptor_;
    alignas(inotify_event) std::array<char, 64 * (sizeof(inotify_event) + NAME_MAX + 1)> buffer_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stopping_{false};
};

} // namespace map_tail
