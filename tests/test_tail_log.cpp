#include <catch2/catch.hpp>
#include "tail_log.hpp"
#include <string>
#include <vector>

using namespace map_tail;

namespace {

struct Captured {
    LogLevel level;
    std::string component;
    std::string message;
};

// Installs a capturing sink and restores the process defaults afterwards
struct CaptureLog {
    std::vector<Captured> entries;

    CaptureLog() {
        TailLog::set_sink([this](LogLevel level, const std::string& component,
                                 const std::string& message) {
            entries.push_back(Captured{level, component, message});
        });
    }

    ~CaptureLog() {
        TailLog::set_sink(nullptr);
        TailLog::set_threshold(LogLevel::Info);
    }
};

} // namespace

TEST_CASE("TailLog filters by threshold", "[log]") {
    CaptureLog capture;

    SECTION("Debug messages are dropped by default") {
        TailLog::debug("Mapper", "mapping");
        TailLog::log("Tail", "started");
        TailLog::error("Reader", "failed");

        REQUIRE(capture.entries.size() == 2);
        REQUIRE(capture.entries[0].level == LogLevel::Info);
        REQUIRE(capture.entries[0].component == "Tail");
        REQUIRE(capture.entries[1].level == LogLevel::Error);
        REQUIRE(capture.entries[1].message == "failed");
    }

    SECTION("Lowering the threshold lets debug through") {
        TailLog::set_threshold(LogLevel::Debug);
        REQUIRE(TailLog::enabled(LogLevel::Debug));
        TailLog::debug("Mapper", "mapping");
        REQUIRE(capture.entries.size() == 1);
        REQUIRE(capture.entries[0].level == LogLevel::Debug);
    }

    SECTION("Raising the threshold keeps only errors") {
        TailLog::set_threshold(LogLevel::Error);
        REQUIRE_FALSE(TailLog::enabled(LogLevel::Info));
        TailLog::log("Tail", "started");
        TailLog::error("Reader", "failed");
        REQUIRE(capture.entries.size() == 1);
        REQUIRE(capture.entries[0].component == "Reader");
    }
}

TEST_CASE("log_level_to_string names every level", "[log]") {
    REQUIRE(std::string(log_level_to_string(LogLevel::Debug)) == "debug");
    REQUIRE(std::string(log_level_to_string(LogLevel::Info)) == "info");
    REQUIRE(std::string(log_level_to_string(LogLevel::Error)) == "error");
}
