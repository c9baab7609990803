#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace map_tail {

constexpr std::uint64_t DEFAULT_PARTITION_SIZE = 1024;
constexpr std::uint64_t DEFAULT_MAX_BYTES = DEFAULT_PARTITION_SIZE * 1000;

// Bytes per mapped window and total backward scan cap
struct ReadConfiguration {
    std::uint64_t partition_size = DEFAULT_PARTITION_SIZE;
    std::uint64_t max_bytes = DEFAULT_MAX_BYTES;

    // Throws ConfigurationError unless 0 < partition_size <= max_bytes
    void validate() const;

    // ceil(max_bytes / partition_size)
    std::uint64_t max_mappings() const;
};

// Half-open byte range [begin, end) of one window
struct PartitionRange {
    std::uint64_t begin = 0;
    std::uint64_t end = 0;

    std::uint64_t size() const { return end - begin; }
    bool empty() const { return end <= begin; }
};

// k-th window counted backward from end-of-file (k starts at 1):
// [max(0, L - k*size), max(0, L - (k-1)*size))
PartitionRange partition_range(std::uint64_t file_length, std::uint64_t k,
                               std::uint64_t partition_size);

// Decoded text of one window together with its source offset
struct Partition {
    std::uint64_t offset = 0;
    std::string text;

    std::uint64_t end() const { return offset + text.size(); }
};

struct ScanResult {
    std::vector<Partition> partitions;  // File order, oldest first
    std::uint64_t file_length = 0;
    std::uint64_t mappings = 0;

    // Offset of the first scanned byte (file_length when nothing was scanned)
    std::uint64_t first_offset() const {
        return partitions.empty() ? file_length : partitions.front().offset;
    }
};

} // namespace map_tail
