#include <catch2/catch.hpp>
#include "errors.hpp"
#include "line_reconstructor.hpp"
#include "partition_mapper.hpp"
#include "temp_file.hpp"
#include <cstdio>
#include <limits>
#include <string>
#include <vector>

using namespace map_tail;
using map_tail::testing::TempDir;
using map_tail::testing::write_file;

namespace {

ReadConfiguration sizes(std::uint64_t partition_size, std::uint64_t max_bytes) {
    ReadConfiguration config;
    config.partition_size = partition_size;
    config.max_bytes = max_bytes;
    return config;
}

// 100 lines of exactly 9 bytes: "line 000\n" .. "line 099\n"
std::string numbered_lines(int count) {
    std::string content;
    char buf[16];
    for (int i = 0; i < count; ++i) {
        std::snprintf(buf, sizeof(buf), "line %03d\n", i);
        content += buf;
    }
    return content;
}

} // namespace

TEST_CASE("PartitionMapper scans files backward", "[mapper]") {
    TempDir dir;
    const std::string path = dir.file("app.log");

    SECTION("Empty file yields nothing and maps nothing") {
        write_file(path, "");
        PartitionMapper mapper(sizes(4, 16));
        auto scan = mapper.scan(path, 10);
        REQUIRE(scan.partitions.empty());
        REQUIRE(scan.file_length == 0);
        REQUIRE(scan.mappings == 0);
    }

    SECTION("File shorter than one partition is a single short partition") {
        write_file(path, "hello\nworld");
        PartitionMapper mapper(sizes(64, 1024));
        auto scan = mapper.scan(path, 10);
        REQUIRE(scan.partitions.size() == 1);
        REQUIRE(scan.partitions[0].offset == 0);
        REQUIRE(scan.partitions[0].text == "hello\nworld");
        REQUIRE(scan.mappings == 1);
    }

    SECTION("Partitions come back in file order and tile the scanned range") {
        const std::string content = numbered_lines(20);
        write_file(path, content);
        PartitionMapper mapper(sizes(7, 1000));
        auto scan = mapper.scan(path, 1000);

        REQUIRE(scan.first_offset() == 0);
        REQUIRE(scan.partitions.back().end() == content.size());
        std::string joined;
        for (size_t i = 0; i < scan.partitions.size(); ++i) {
            if (i > 0) {
                REQUIRE(scan.partitions[i - 1].end() == scan.partitions[i].offset);
            }
            joined += scan.partitions[i].text;
        }
        REQUIRE(joined == content);
        REQUIRE(join_partitions(scan.partitions) == split_lines(content));
    }

    SECTION("Byte cap bounds the number of mappings") {
        write_file(path, numbered_lines(100));
        PartitionMapper mapper(sizes(10, 50));
        auto scan = mapper.scan(path, 1000);
        REQUIRE(scan.mappings == 5);
        REQUIRE(scan.mappings <= mapper.config().max_mappings());
        REQUIRE(scan.first_offset() == 850);
    }

    SECTION("Scan stops once enough lines were seen") {
        write_file(path, numbered_lines(100));
        PartitionMapper mapper(sizes(9, 900));
        auto scan = mapper.scan(path, 3);
        // One newline per window, stop after more than 3 + 1
        REQUIRE(scan.mappings == 5);
        REQUIRE(scan.first_offset() == 855);
    }

    SECTION("Unbounded line demand scans the whole file") {
        const std::string content = numbered_lines(50);
        write_file(path, content);
        PartitionMapper mapper(sizes(8, 4096));
        auto scan = mapper.scan(path, std::numeric_limits<std::size_t>::max());
        REQUIRE(scan.first_offset() == 0);
        REQUIRE(join_partitions(scan.partitions).size() == 50);
    }

    SECTION("Unbounded byte cap still maps the file") {
        const std::string content = numbered_lines(50);
        write_file(path, content);
        PartitionMapper mapper(sizes(1024, std::numeric_limits<std::uint64_t>::max()));
        auto scan = mapper.scan(path, 10);
        REQUIRE(scan.mappings == 1);
        REQUIRE(scan.file_length == content.size());
        REQUIRE(join_partitions(scan.partitions) == split_lines(content));
    }

    SECTION("Length comes from the opened file when the path is replaced") {
        write_file(path, numbered_lines(100));
        PartitionMapper mapper(sizes(9, 900));
        auto first = mapper.scan(path, 2);

        // Rotation: a shorter file takes the name between scans
        const std::string rotated = dir.file("app.log.new");
        write_file(rotated, "fresh\n");
        REQUIRE(std::rename(rotated.c_str(), path.c_str()) == 0);
        auto second = mapper.scan(path, 2);
        REQUIRE(first.file_length == 900);
        REQUIRE(second.file_length == 6);
        REQUIRE(join_partitions(second.partitions) == std::vector<std::string>{"fresh"});
    }

    SECTION("Mapping count never exceeds the cap for any file length") {
        for (int count : {0, 1, 5, 37, 100}) {
            write_file(path, numbered_lines(count));
            for (std::uint64_t size : {1u, 4u, 9u, 16u, 100u}) {
                PartitionMapper mapper(sizes(size, 100));
                auto scan = mapper.scan(path, 100000);
                REQUIRE(scan.mappings <= mapper.config().max_mappings());
            }
        }
    }
}

TEST_CASE("PartitionMapper failures", "[mapper][errors]") {
    TempDir dir;
    const std::string path = dir.file("app.log");

    SECTION("Invalid sizes are rejected at construction") {
        REQUIRE_THROWS_AS(PartitionMapper(sizes(0, 10)), ConfigurationError);
        REQUIRE_THROWS_AS(PartitionMapper(sizes(11, 10)), ConfigurationError);
    }

    SECTION("Missing file is an IOError") {
        PartitionMapper mapper(sizes(4, 16));
        REQUIRE_THROWS_AS(mapper.scan(dir.file("missing.log"), 10), IOError);
    }

    SECTION("Non-ASCII bytes are a DecodeError with the file offset") {
        write_file(path, "ok\ncaf\xC3\xA9\n");
        PartitionMapper mapper(sizes(4, 64));
        try {
            mapper.scan(path, 10);
            FAIL("expected DecodeError");
        } catch (const DecodeError& e) {
            REQUIRE(e.offset() == 6);
        }
    }

    SECTION("decode accepts every ASCII byte") {
        std::string ascii;
        for (int c = 0; c < 0x80; ++c) {
            ascii.push_back(static_cast<char>(c));
        }
        REQUIRE(PartitionMapper::decode(ascii.data(), ascii.size(), 0) == ascii);
    }

    SECTION("count_lines counts delimiters") {
        REQUIRE(PartitionMapper::count_lines("") == 0);
        REQUIRE(PartitionMapper::count_lines("abc") == 0);
        REQUIRE(PartitionMapper::count_lines("\na\nb\n") == 3);
    }
}
