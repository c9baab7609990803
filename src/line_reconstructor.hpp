#pragma once

#include "partition.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace map_tail {

constexpr char LINE_DELIMITER = '\n';

// Split on the delimiter; a single trailing delimiter does not produce a
// trailing empty line and empty text yields no lines.
std::vector<std::string> split_lines(std::string_view text);

// Stitch partitions (file order) into lines, most recent last. Lines crossing
// a partition boundary are rejoined, so the result equals split_lines() over
// the concatenated partition texts.
std::vector<std::string> join_partitions(const std::vector<Partition>& partitions);

} // namespace map_tail
