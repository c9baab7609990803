#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>

namespace map_tail {

constexpr std::size_t DEFAULT_MAX_LINES = 1000;

// Number of lines the viewer currently wants; read once per tail read
class LineBudget {
public:
    explicit LineBudget(std::size_t max_lines = DEFAULT_MAX_LINES)
        : max_lines_(std::max<std::size_t>(1, max_lines))
    {
    }

    std::size_t max_lines() const { return max_lines_; }
    void set_max_lines(std::size_t lines) { max_lines_ = std::max<std::size_t>(1, lines); }

    void grow(std::size_t by) { set_max_lines(max_lines_ + by); }
    void shrink(std::size_t by) { set_max_lines(max_lines_ > by ? max_lines_ - by : 1); }

private:
    std::atomic<std::size_t> max_lines_;
};

} // namespace map_tail
