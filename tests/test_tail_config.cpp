#include <catch2/catch.hpp>
#include "errors.hpp"
#include "tail_config.hpp"
#include "temp_file.hpp"

using namespace map_tail;
using map_tail::testing::TempDir;
using map_tail::testing::write_file;

TEST_CASE("TailConfig defaults and validation", "[config]") {
    TailConfig config;
    REQUIRE(config.partition_size == DEFAULT_PARTITION_SIZE);
    REQUIRE(config.max_bytes == DEFAULT_MAX_BYTES);
    REQUIRE(config.max_lines == DEFAULT_MAX_LINES);
    REQUIRE(config.follow);
    REQUIRE(config.mode == OutputMode::Ui);

    SECTION("A path is required") {
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
        config.path = "app.log";
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Partition size must fit in the byte cap") {
        config.path = "app.log";
        config.partition_size = config.max_bytes + 1;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }

    SECTION("Zero lines is rejected") {
        config.path = "app.log";
        config.max_lines = 0;
        REQUIRE_THROWS_AS(config.validate(), ConfigurationError);
    }
}

TEST_CASE("TailConfig JSON", "[config][json]") {
    SECTION("Known keys are applied, unknown keys ignored") {
        TailConfig config;
        config.merge_json({
            {"path", "/var/log/syslog"},
            {"partition_size", 4096},
            {"max_bytes", 65536},
            {"max_lines", 200},
            {"follow", false},
            {"mode", "json"},
            {"colour", "blue"}
        });
        REQUIRE(config.path == "/var/log/syslog");
        REQUIRE(config.partition_size == 4096);
        REQUIRE(config.max_bytes == 65536);
        REQUIRE(config.max_lines == 200);
        REQUIRE_FALSE(config.follow);
        REQUIRE(config.mode == OutputMode::Json);

        auto json = config.to_json();
        REQUIRE(json["partition_size"] == 4096);
        REQUIRE(json["mode"] == "json");
        REQUIRE(json["follow"] == false);
    }

    SECTION("Wrong types are configuration errors") {
        TailConfig config;
        REQUIRE_THROWS_AS(config.merge_json({{"max_lines", "many"}}), ConfigurationError);
        REQUIRE_THROWS_AS(config.merge_json({{"partition_size", -1}}), ConfigurationError);
        REQUIRE_THROWS_AS(config.merge_json({{"mode", "fancy"}}), ConfigurationError);
        REQUIRE_THROWS_AS(config.merge_json(nlohmann::json::array()), ConfigurationError);
    }

    SECTION("Loading from a file") {
        TempDir dir;
        const std::string path = dir.file("map_tail.json");
        write_file(path, R"({"path": "app.log", "max_lines": 25})");
        auto config = TailConfig::load_file(path);
        REQUIRE(config.path == "app.log");
        REQUIRE(config.max_lines == 25);

        write_file(path, "{not json");
        REQUIRE_THROWS_AS(TailConfig::load_file(path), ConfigurationError);
        REQUIRE_THROWS_AS(TailConfig::load_file(dir.file("missing.json")), ConfigurationError);
    }
}

TEST_CASE("Command-line parsing", "[config][cli]") {
    SECTION("Options and positional path") {
        auto cli = parse_command_line({"--lines", "50", "--partition-size", "512",
                                       "--max-bytes", "8192", "--no-follow", "--plain", "app.log"});
        REQUIRE_FALSE(cli.show_help);
        REQUIRE(cli.config.path == "app.log");
        REQUIRE(cli.config.max_lines == 50);
        REQUIRE(cli.config.partition_size == 512);
        REQUIRE(cli.config.max_bytes == 8192);
        REQUIRE_FALSE(cli.config.follow);
        REQUIRE(cli.config.mode == OutputMode::Plain);
    }

    SECTION("Help flag") {
        REQUIRE(parse_command_line({"--help"}).show_help);
        REQUIRE(parse_command_line({"-h"}).show_help);
    }

    SECTION("Command line overrides the config file") {
        TempDir dir;
        const std::string file = dir.file("map_tail.json");
        write_file(file, R"({"path": "from-file.log", "max_lines": 25, "mode": "json"})");

        auto cli = parse_command_line({"-n", "75", "--config", file});
        REQUIRE(cli.config.path == "from-file.log");
        REQUIRE(cli.config.max_lines == 75);
        REQUIRE(cli.config.mode == OutputMode::Json);
    }

    SECTION("Bad input") {
        REQUIRE_THROWS_AS(parse_command_line({"--frobnicate"}), ConfigurationError);
        REQUIRE_THROWS_AS(parse_command_line({"--lines", "-3", "app.log"}), ConfigurationError);
        REQUIRE_THROWS_AS(parse_command_line({"--lines", "12abc", "app.log"}), ConfigurationError);
        REQUIRE_THROWS_AS(parse_command_line({"--config"}), ConfigurationError);
    }
}
