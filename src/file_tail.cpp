#include "file_tail.hpp"
#include "errors.hpp"
#include "line_reconstructor.hpp"
#include "tail_log.hpp"

namespace map_tail {

namespace {

ReadConfiguration make_config(std::uint64_t max_bytes, std::uint64_t partition_size) {
    ReadConfiguration config;
    config.max_bytes = max_bytes;
    config.partition_size = partition_size;
    return config;
}

} // namespace

FileTail::FileTail(const std::string& path, LineFeed line_feed, LineCountPolicy max_lines,
                   ErrorReporter reporter, std::uint64_t max_bytes, std::uint64_t partition_size)
    : path_(path)
    , line_feed_(std::move(line_feed))
    , max_lines_(std::move(max_lines))
    , reporter_(std::move(reporter))
    , mapper_(make_config(max_bytes, partition_size))
    , watcher_(path, [this]() { on_file_changed(); })
{
    if (path_.empty()) {
        throw ConfigurationError("File path must not be empty");
    }
    if (!line_feed_) {
        throw ConfigurationError("A line feed callback is required");
    }
    if (!max_lines_) {
        throw ConfigurationError("A line-count policy is required");
    }
}

FileTail::FileTail(const std::string& path, LineFeed line_feed, LineCountPolicy max_lines,
                   ErrorReporter reporter)
    : FileTail(path, std::move(line_feed), std::move(max_lines), std::move(reporter),
               DEFAULT_MAX_BYTES, DEFAULT_PARTITION_SIZE)
{
}

FileTail::~FileTail() {
    stop();
    // A stop() issued from the line feed leaves the lane finishing its read
    lane_.join();
}

void FileTail::set_state(SessionState next) {
    // Stopped is terminal
    SessionState current = state_.load();
    while (current != SessionState::Stopped &&
           !state_.compare_exchange_weak(current, next)) {
    }
}

void FileTail::start(DoneCallback on_done, bool follow) {
    if (closed_ || started_.exchange(true)) {
        TailLog::error("Tail", "Session for " + path_ + " was already started or stopped");
        if (on_done) on_done(false);
        return;
    }

    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        pending_done_ = std::move(on_done);
    }

    lane_.start();

    bool posted = lane_.post([this, follow]() {
        DoneCallback done = take_done();
        bool ok = read_once();

        if (ok && follow && !closed_) {
            std::lock_guard<std::mutex> lock(watcher_mutex_);
            if (!closed_) {
                try {
                    watcher_.start();
                    set_state(SessionState::Watching);
                } catch (const WatchError& e) {
                    TailLog::error("Tail", std::string("Live updates unavailable: ") + e.what());
                }
            }
        }

        if (done) done(ok);
    });

    if (!posted) {
        if (auto done = take_done()) done(false);
    }
}

FileTail::DoneCallback FileTail::take_done() {
    std::lock_guard<std::mutex> lock(done_mutex_);
    DoneCallback done = std::move(pending_done_);
    pending_done_ = nullptr;
    return done;
}

void FileTail::stop() {
    if (closed_.exchange(true)) return;
    state_ = SessionState::Stopped;

    {
        std::lock_guard<std::mutex> lock(watcher_mutex_);
        watcher_.stop();
    }
    lane_.shutdown();

    // The initial read was discarded before it ran
    if (auto done = take_done()) done(false);

    TailLog::log("Tail", "Stopped tailing: " + path_);
}

void FileTail::refresh() {
    if (!started_) return;
    on_file_changed();
}

void FileTail::on_file_changed() {
    if (closed_) return;
    lane_.post([this]() {
        triggered_read();
    });
}

void FileTail::triggered_read() {
    if (closed_) return;
    read_once();
}

bool FileTail::read_once() {
    if (closed_) return false;
    set_state(SessionState::Reading);

    bool ok = false;
    std::vector<std::string> lines;
    try {
        lines = read_lines(max_lines_());
        completed_reads_++;
        ok = true;
    } catch (const DecodeError& e) {
        TailLog::error("Reader", "Bad encoding in " + path_ + ": " + e.what());
        report("Bad encoding: " + path_ + ": " + e.what());
    } catch (const IOError& e) {
        TailLog::error("Reader", e.what());
    } catch (const std::exception& e) {
        TailLog::error("Reader", "Error reading " + path_ + ": " + e.what());
    }

    // A failing consumer does not make the read itself a failure
    if (ok && !closed_) {
        try {
            line_feed_(std::move(lines));
        } catch (const std::exception& e) {
            TailLog::error("Tail", "Line consumer failed for " + path_ + ": " + e.what());
        }
    }

    set_state(watcher_.is_running() ? SessionState::Watching : SessionState::Idle);
    return ok;
}

std::vector<std::string> FileTail::read_lines(std::size_t wanted) {
    ScanResult scan = mapper_.scan(path_, wanted);
    std::vector<std::string> lines = join_partitions(scan.partitions);

    // The oldest line may have started before the scanned range
    if (scan.first_offset() > 0 && !lines.empty()) {
        lines.erase(lines.begin());
    }
    if (lines.size() > wanted) {
        lines.erase(lines.begin(), lines.end() - static_cast<std::ptrdiff_t>(wanted));
    }

    TailLog::debug("Reader", "Read " + std::to_string(lines.size()) + " lines from " + path_ +
                   " (" + std::to_string(scan.file_length) + " bytes, " +
                   std::to_string(scan.mappings) + " mappings)");
    return lines;
}

void FileTail::report(const std::string& message) {
    if (!reporter_) return;
    try {
        reporter_(message);
    } catch (const std::exception& e) {
        TailLog::error("Tail", std::string("Error reporter failed: ") + e.what());
    }
}

} // namespace map_tail
