#pragma once

#include "line_budget.hpp"
#include "partition.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace map_tail {

enum class OutputMode : int {
    Ui = 0,
    Plain = 1,
    Json = 2
};

std::string output_mode_to_string(OutputMode mode);
OutputMode string_to_output_mode(const std::string& s);

struct TailConfig {
    std::string path;
    std::uint64_t max_bytes = DEFAULT_MAX_BYTES;
    std::uint64_t partition_size = DEFAULT_PARTITION_SIZE;
    std::size_t max_lines = DEFAULT_MAX_LINES;
    bool follow = true;
    OutputMode mode = OutputMode::Ui;
    bool verbose = false;

    // Throws ConfigurationError
    void validate() const;

    ReadConfiguration read_configuration() const;

    nlohmann::json to_json() const;

    // Overlay the keys present in j onto this config; unknown keys are ignored
    void merge_json(const nlohmann::json& j);

    static TailConfig load_file(const std::string& path);
};

// Result of command-line parsing
struct CommandLine {
    TailConfig config;
    bool show_help = false;
};

// Throws ConfigurationError on unknown options or malformed values. A
// --config file is applied first, then the remaining options override it.
CommandLine parse_command_line(const std::vector<std::string>& args);

std::string usage(const std::string& program);

} // namespace map_tail
