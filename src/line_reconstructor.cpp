#include "line_reconstructor.hpp"
#include <algorithm>
#include <optional>

namespace map_tail {

namespace {

// n delimiters always give n + 1 fragments
std::vector<std::string> split_fragments(std::string_view text) {
    std::vector<std::string> fragments;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(LINE_DELIMITER, start);
        if (pos == std::string_view::npos) {
            fragments.emplace_back(text.substr(start));
            break;
        }
        fragments.emplace_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return fragments;
}

} // namespace

std::vector<std::string> split_lines(std::string_view text) {
    auto lines = split_fragments(text);
    if (lines.back().empty()) {
        lines.pop_back();
    }
    return lines;
}

std::vector<std::string> join_partitions(const std::vector<Partition>& partitions) {
    // Built newest line first, reversed at the end
    std::vector<std::string> reversed;

    // First fragment of the newer partition: it continues the last fragment of
    // the partition processed next. When the boundary byte is a delimiter one of
    // the two sides is empty and the join is a no-op.
    std::optional<std::string> join_previous;

    for (auto it = partitions.rbegin(); it != partitions.rend(); ++it) {
        auto fragments = split_fragments(it->text);

        if (join_previous) {
            fragments.back() += *join_previous;
            join_previous.reset();
        }

        for (std::size_t i = fragments.size() - 1; i > 0; --i) {
            reversed.push_back(std::move(fragments[i]));
        }
        join_previous = std::move(fragments.front());
    }

    if (join_previous) {
        reversed.push_back(std::move(*join_previous));
    }

    // Trailing delimiter at the end of the range leaves one empty fragment
    if (!reversed.empty() && reversed.front().empty()) {
        reversed.erase(reversed.begin());
    }

    std::reverse(reversed.begin(), reversed.end());
    return reversed;
}

} // namespace map_tail
