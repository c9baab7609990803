#include "partition.hpp"
#include "errors.hpp"

namespace map_tail {

void ReadConfiguration::validate() const {
    if (partition_size == 0) {
        throw ConfigurationError("partition_size must be > 0");
    }
    if (partition_size > max_bytes) {
        throw ConfigurationError("partition_size (" + std::to_string(partition_size) +
                                 ") > max_bytes (" + std::to_string(max_bytes) + ")");
    }
}

std::uint64_t ReadConfiguration::max_mappings() const {
    // Rounded up without forming max_bytes + partition_size
    return max_bytes / partition_size + (max_bytes % partition_size != 0 ? 1 : 0);
}

PartitionRange partition_range(std::uint64_t file_length, std::uint64_t k,
                               std::uint64_t partition_size) {
    PartitionRange range;
    if (k == 0 || partition_size == 0) {
        return range;
    }

    // Windows past the start of the file collapse to [0, 0)
    const std::uint64_t back = (k - 1) * partition_size;
    if (back >= file_length) {
        return range;
    }
    range.end = file_length - back;
    range.begin = range.end > partition_size ? range.end - partition_size : 0;
    return range;
}

} // namespace map_tail
