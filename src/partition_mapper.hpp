#pragma once

#include "partition.hpp"
#include <cstddef>
#include <string>

namespace map_tail {

// Maps bounded windows of a file backward from end-of-file and decodes them
class PartitionMapper {
public:
    explicit PartitionMapper(ReadConfiguration config);

    // Scan backward until more than wanted_lines + 1 newlines were seen, the
    // start of the file was reached or max_mappings() windows were mapped.
    // Throws IOError when the file cannot be opened or mapped, DecodeError on
    // bytes outside US-ASCII.
    ScanResult scan(const std::string& path, std::size_t wanted_lines) const;

    const ReadConfiguration& config() const { return config_; }

    // US-ASCII decoder; offset is the absolute file offset of data[0]
    static std::string decode(const char* data, std::size_t size, std::uint64_t offset);

    static std::size_t count_lines(const std::string& text);

private:
    ReadConfiguration config_;
};

} // namespace map_tail
