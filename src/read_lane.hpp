#pragma once

#include <asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <thread>

namespace map_tail {

// Serial execution lane: one io_context run by exactly one thread, so posted
// tasks execute one at a time in posting order.
class ReadLane {
public:
    using Task = std::function<void()>;

    ReadLane();
    ~ReadLane();

    // Non-copyable
    ReadLane(const ReadLane&) = delete;
    ReadLane& operator=(const ReadLane&) = delete;

    void start();

    // Returns false once the lane was shut down
    bool post(Task task);

    // Stops the lane, discarding tasks that have not started. Waits for a
    // running task unless called from the lane thread itself.
    void shutdown();

    // Wait for the lane thread to exit after shutdown(); no-op on the lane thread
    void join();

    bool on_lane_thread() const;

private:
    static void run(const std::shared_ptr<asio::io_context>& io_context);

    // Shared with the lane thread so a lane destroyed from its own task stays valid
    std::shared_ptr<asio::io_context> io_context_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> work_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
};

} // namespace map_tail
