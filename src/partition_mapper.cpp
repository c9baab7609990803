#include "partition_mapper.hpp"
#include "errors.hpp"
#include "tail_log.hpp"
#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <algorithm>
#include <sys/stat.h>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <iomanip>

namespace map_tail {

namespace bip = boost::interprocess;

PartitionMapper::PartitionMapper(ReadConfiguration config)
    : config_(config)
{
    config_.validate();
}

std::string PartitionMapper::decode(const char* data, std::size_t size, std::uint64_t offset) {
    for (std::size_t i = 0; i < size; ++i) {
        auto byte = static_cast<unsigned char>(data[i]);
        if (byte >= 0x80) {
            std::ostringstream msg;
            msg << "Malformed input: byte 0x" << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(byte) << std::dec << " at offset " << (offset + i);
            throw DecodeError(msg.str(), offset + i);
        }
    }
    return std::string(data, size);
}

namespace {

// Length of the inode the mapping holds, not whatever the path names now
std::uint64_t mapped_file_length(const bip::file_mapping& mapping, const std::string& path) {
    struct stat st;
    if (::fstat(mapping.get_mapping_handle().handle, &st) != 0) {
        throw IOError("Cannot stat " + path + ": " + std::strerror(errno));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

} // namespace

std::size_t PartitionMapper::count_lines(const std::string& text) {
    return static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));
}

ScanResult PartitionMapper::scan(const std::string& path, std::size_t wanted_lines) const {
    ScanResult result;

    try {
        // Opened per scan, closed when the mapping goes out of scope
        bip::file_mapping mapping(path.c_str(), bip::read_only);

        result.file_length = mapped_file_length(mapping, path);
        if (result.file_length == 0) {
            return result;
        }

        const std::uint64_t max_mappings = config_.max_mappings();
        std::uint64_t total_lines = 0;

        for (std::uint64_t k = 1; k <= max_mappings; ++k) {
            PartitionRange range = partition_range(result.file_length, k, config_.partition_size);
            if (range.empty()) break;

            TailLog::debug("Mapper", "Mapping file partition from " + std::to_string(range.begin) +
                           " to " + std::to_string(range.end));

            bip::mapped_region region(mapping, bip::read_only,
                                      static_cast<bip::offset_t>(range.begin),
                                      static_cast<std::size_t>(range.size()));
            result.mappings++;

            // Touching pages past a truncated end would fault
            if (mapped_file_length(mapping, path) < range.end) {
                throw IOError(path + " was truncated while reading");
            }

            Partition partition;
            partition.offset = range.begin;
            partition.text = decode(static_cast<const char*>(region.get_address()),
                                    region.get_size(), range.begin);
            total_lines += count_lines(partition.text);
            result.partitions.push_back(std::move(partition));

            // One spare newline: the oldest line may be partial and gets dropped
            if (total_lines > wanted_lines && total_lines - wanted_lines > 1) {
                TailLog::debug("Mapper", "Got enough lines already: " + std::to_string(total_lines));
                break;
            }
            if (range.begin == 0) break;
        }
    } catch (const bip::interprocess_exception& e) {
        throw IOError("Failed to map " + path + ": " + e.what());
    }

    std::reverse(result.partitions.begin(), result.partitions.end());

    TailLog::debug("Mapper", "Done mapping file in " + std::to_string(result.mappings) + " of " +
                   std::to_string(config_.max_mappings()) + " iterations");
    return result;
}

} // namespace map_tail
