#include "read_lane.hpp"
#include "tail_log.hpp"

namespace map_tail {

ReadLane::ReadLane()
    : io_context_(std::make_shared<asio::io_context>())
    , work_(asio::make_work_guard(*io_context_))
{
}

ReadLane::~ReadLane() {
    shutdown();
    join();
    if (thread_.joinable()) {
        // Destroyed from a task on the lane itself
        thread_.detach();
    }
}

void ReadLane::start() {
    if (running_ || shut_down_) return;
    running_ = true;
    thread_ = std::thread([io_context = io_context_]() {
        run(io_context);
    });
}

void ReadLane::run(const std::shared_ptr<asio::io_context>& io_context) {
    while (!io_context->stopped()) {
        try {
            io_context->run();
        } catch (const std::exception& e) {
            // A task must not take the lane down with it
            TailLog::error("Lane", std::string("Task failed: ") + e.what());
        }
    }
}

bool ReadLane::post(Task task) {
    if (shut_down_) return false;
    asio::post(*io_context_, std::move(task));
    return true;
}

bool ReadLane::on_lane_thread() const {
    return thread_.get_id() == std::this_thread::get_id();
}

void ReadLane::join() {
    if (thread_.joinable() && !on_lane_thread()) {
        thread_.join();
    }
}

void ReadLane::shutdown() {
    if (shut_down_.exchange(true)) return;
    work_.reset();
    io_context_->stop();
    if (thread_.joinable() && !on_lane_thread()) {
        thread_.join();
    }
    running_ = false;
}

} // namespace map_tail
