#include <catch2/catch.hpp>
#include "errors.hpp"
#include "partition.hpp"
#include <cstdint>
#include <limits>

using namespace map_tail;

TEST_CASE("partition_range walks backward from end-of-file", "[partition]") {
    SECTION("Full windows then a short oldest window") {
        auto first = partition_range(10, 1, 4);
        REQUIRE(first.begin == 6);
        REQUIRE(first.end == 10);

        auto second = partition_range(10, 2, 4);
        REQUIRE(second.begin == 2);
        REQUIRE(second.end == 6);

        auto third = partition_range(10, 3, 4);
        REQUIRE(third.begin == 0);
        REQUIRE(third.end == 2);
        REQUIRE(third.size() == 2);

        REQUIRE(partition_range(10, 4, 4).empty());
    }

    SECTION("File shorter than one partition") {
        auto range = partition_range(3, 1, 8);
        REQUIRE(range.begin == 0);
        REQUIRE(range.end == 3);
        REQUIRE(partition_range(3, 2, 8).empty());
    }

    SECTION("Length is an exact multiple of the partition size") {
        auto range = partition_range(8, 2, 4);
        REQUIRE(range.begin == 0);
        REQUIRE(range.end == 4);
        REQUIRE(partition_range(8, 3, 4).empty());
    }

    SECTION("Degenerate inputs never produce a window") {
        REQUIRE(partition_range(10, 0, 4).empty());
        REQUIRE(partition_range(0, 1, 4).empty());
        REQUIRE(partition_range(10, 1, 0).empty());
    }

    SECTION("Windows tile the file without gaps") {
        const std::uint64_t length = 1000;
        for (std::uint64_t size : {1u, 3u, 7u, 64u, 999u, 1000u, 4096u}) {
            std::uint64_t expected_end = length;
            std::uint64_t k = 1;
            for (auto range = partition_range(length, k, size); !range.empty();
                 range = partition_range(length, ++k, size)) {
                REQUIRE(range.end == expected_end);
                REQUIRE(range.size() <= size);
                REQUIRE(range.size() > 0);
                expected_end = range.begin;
            }
            REQUIRE(expected_end == 0);
        }
    }
}

TEST_CASE("ReadConfiguration validation", "[partition][config]") {
    ReadConfiguration config;

    SECTION("Defaults are valid") {
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.max_mappings() == 1000);
    }

    SECTION("Zero partition size is rejected") {
        config.partition_size = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Partition larger than the byte cap is rejected") {
        config.partition_size = 10;
        config.max_bytes = 9;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Partition equal to the byte cap is accepted") {
        config.partition_size = 9;
        config.max_bytes = 9;
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.max_mappings() == 1);
    }

    SECTION("max_mappings rounds up") {
        config.partition_size = 3;
        config.max_bytes = 9;
        REQUIRE(config.max_mappings() == 3);
        config.max_bytes = 10;
        REQUIRE(config.max_mappings() == 4);
    }

    SECTION("max_mappings does not wrap near the top of the range") {
        config.partition_size = 1024;
        config.max_bytes = std::numeric_limits<std::uint64_t>::max();
        REQUIRE_NOTHROW(config.validate());
        REQUIRE(config.max_mappings() == std::numeric_limits<std::uint64_t>::max() / 1024 + 1);

        config.partition_size = 1;
        REQUIRE(config.max_mappings() == std::numeric_limits<std::uint64_t>::max());
    }
}
