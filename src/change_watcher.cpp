#include "change_watcher.hpp"
#include "errors.hpp"
#include "tail_log.hpp"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <unistd.h>

namespace map_tail {

ChangeWatcher::ChangeWatcher(const std::string& path, Callback on_change)
    : on_change_(std::move(on_change))
    , descriptor_(io_context_)
{
    std::filesystem::path p(path);
    file_name_ = p.filename().string();
    directory_ = p.has_parent_path() ? p.parent_path().string() : ".";
}

ChangeWatcher::~ChangeWatcher() {
    stop();
}

std::vector<WatchEvent> ChangeWatcher::parse_events(const char* buffer, std::size_t length) {
    std::vector<WatchEvent> events;
    std::size_t offset = 0;
    while (offset + sizeof(inotify_event) <= length) {
        inotify_event raw;
        std::memcpy(&raw, buffer + offset, sizeof(inotify_event));

        std::size_t record_size = sizeof(inotify_event) + raw.len;
        if (offset + record_size > length) break;

        WatchEvent event;
        event.mask = raw.mask;
        if (raw.len > 0) {
            // Name is NUL-padded to the record length
            const char* name = buffer + offset + sizeof(inotify_event);
            event.name.assign(name, strnlen(name, raw.len));
        }
        events.push_back(std::move(event));
        offset += record_size;
    }
    return events;
}

void ChangeWatcher::start() {
    if (running_ || stopping_) return;

    int fd = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
    if (fd < 0) {
        throw WatchError(std::string("inotify_init1 failed: ") + std::strerror(errno));
    }

    if (inotify_add_watch(fd, directory_.c_str(), WATCH_MASK) < 0) {
        int err = errno;
        ::close(fd);
        throw WatchError("Cannot watch " + directory_ + ": " + std::strerror(err));
    }

    asio::error_code ec;
    descriptor_.assign(fd, ec);
    if (ec) {
        ::close(fd);
        throw WatchError("Cannot attach inotify descriptor: " + ec.message());
    }

    running_ = true;
    start_read();

    thread_ = std::thread([this]() {
        io_context_.run();
        running_ = false;
    });

    TailLog::log("Watcher", "Watching path " + file_name_ + " in " + directory_);
}

void ChangeWatcher::stop() {
    if (stopping_.exchange(true)) return;

    io_context_.stop();
    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            thread_.detach();
        } else {
            thread_.join();
        }
    }

    asio::error_code ec;
    descriptor_.close(ec);
    running_ = false;
}

void ChangeWatcher::start_read() {
    descriptor_.async_read_some(
        asio::buffer(buffer_),
        [this](const asio::error_code& error, std::size_t bytes_read) {
            handle_read(error, bytes_read);
        }
    );
}

bool ChangeWatcher::is_relevant(const WatchEvent& event) const {
    // Queue overflow may have dropped events for our file
    if (event.mask & IN_Q_OVERFLOW) return true;
    return event.name == file_name_;
}

void ChangeWatcher::handle_read(const asio::error_code& error, std::size_t bytes_read) {
    if (stopping_) return;

    if (error) {
        if (error == asio::error::operation_aborted) {
            TailLog::log("Watcher", "Interrupted watching file " + file_name_);
        } else {
            TailLog::error("Watcher", "Watch failed for " + file_name_ + ": " + error.message());
        }
        return;
    }

    for (const auto& event : parse_events(buffer_.data(), bytes_read)) {
        if (event.mask & IN_IGNORED) {
            // Directory removed or unmounted, nothing more will arrive
            TailLog::error("Watcher", "Watch on " + directory_ + " has been removed");
            return;
        }
        if (!stopping_ && is_relevant(event)) {
            try {
                on_change_();
            } catch (const std::exception& e) {
                TailLog::error("Watcher", std::string("Change handler failed: ") + e.what());
            }
        }
    }

    start_read();
}

} // namespace map_tail
