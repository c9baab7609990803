#include "tail_config.hpp"
#include "errors.hpp"
#include <fstream>
#include <sstream>

namespace map_tail {

std::string output_mode_to_string(OutputMode mode) {
    switch (mode) {
        case OutputMode::Ui: return "ui";
        case OutputMode::Plain: return "plain";
        case OutputMode::Json: return "json";
        default: return "unknown";
    }
}

OutputMode string_to_output_mode(const std::string& s) {
    if (s == "ui") return OutputMode::Ui;
    if (s == "plain") return OutputMode::Plain;
    if (s == "json") return OutputMode::Json;
    throw ConfigurationError("Unknown output mode: " + s);
}

void TailConfig::validate() const {
    if (path.empty()) {
        throw ConfigurationError("No file to tail");
    }
    if (max_lines == 0) {
        throw ConfigurationError("max_lines must be > 0");
    }
    read_configuration().validate();
}

ReadConfiguration TailConfig::read_configuration() const {
    ReadConfiguration config;
    config.partition_size = partition_size;
    config.max_bytes = max_bytes;
    return config;
}

nlohmann::json TailConfig::to_json() const {
    return {
        {"path", path},
        {"max_bytes", max_bytes},
        {"partition_size", partition_size},
        {"max_lines", max_lines},
        {"follow", follow},
        {"mode", output_mode_to_string(mode)},
        {"verbose", verbose}
    };
}

namespace {

std::uint64_t unsigned_field(const nlohmann::json& j, const std::string& key) {
    const auto& value = j.at(key);
    if (!value.is_number_unsigned()) {
        throw ConfigurationError(key + " must be a non-negative integer");
    }
    return value.get<std::uint64_t>();
}

} // namespace

void TailConfig::merge_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigurationError("Configuration must be a JSON object");
    }

    try {
        if (j.contains("path")) path = j["path"].get<std::string>();
        if (j.contains("max_bytes")) max_bytes = unsigned_field(j, "max_bytes");
        if (j.contains("partition_size")) partition_size = unsigned_field(j, "partition_size");
        if (j.contains("max_lines")) max_lines = static_cast<std::size_t>(unsigned_field(j, "max_lines"));
        if (j.contains("follow")) follow = j["follow"].get<bool>();
        if (j.contains("mode")) mode = string_to_output_mode(j["mode"].get<std::string>());
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid configuration: ") + e.what());
    }
}

TailConfig TailConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigurationError("Cannot open config file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Failed to parse " + path + ": " + e.what());
    }

    TailConfig config;
    config.merge_json(j);
    return config;
}

namespace {

std::uint64_t parse_number(const std::string& option, const std::string& value) {
    // Reject signs and trailing garbage that stoull would accept
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError("Invalid value for " + option + ": " + value);
    }
    try {
        return std::stoull(value);
    } catch (const std::exception&) {
        throw ConfigurationError("Value out of range for " + option + ": " + value);
    }
}

} // namespace

CommandLine parse_command_line(const std::vector<std::string>& args) {
    CommandLine result;

    // Config file first so the other options can override it
    for (size_t i = 0; i < args.size(); i++) {
        if (args[i] == "--config") {
            if (i + 1 >= args.size()) {
                throw ConfigurationError("--config requires a file");
            }
            result.config = TailConfig::load_file(args[i + 1]);
        }
    }

    for (size_t i = 0; i < args.size(); i++) {
        const std::string& arg = args[i];
        bool has_value = i + 1 < args.size();

        if (arg == "--help" || arg == "-h") {
            result.show_help = true;
        }
        else if (arg == "--config" && has_value) {
            ++i;
        }
        else if (arg == "--max-bytes" && has_value) {
            result.config.max_bytes = parse_number(arg, args[++i]);
        }
        else if (arg == "--partition-size" && has_value) {
            result.config.partition_size = parse_number(arg, args[++i]);
        }
        else if ((arg == "--lines" || arg == "-n") && has_value) {
            result.config.max_lines = static_cast<std::size_t>(parse_number(arg, args[++i]));
        }
        else if (arg == "--no-follow") {
            result.config.follow = false;
        }
        else if (arg == "--plain") {
            result.config.mode = OutputMode::Plain;
        }
        else if (arg == "--json") {
            result.config.mode = OutputMode::Json;
        }
        else if (arg == "--verbose" || arg == "-v") {
            result.config.verbose = true;
        }
        else if (!arg.empty() && arg[0] != '-') {
            result.config.path = arg;
        }
        else {
            throw ConfigurationError("Unknown option: " + arg);
        }
    }

    return result;
}

std::string usage(const std::string& program) {
    std::ostringstream out;
    out << "map_tail - follow the last lines of a growing text file\n\n";
    out << "Usage: " << program << " [options] FILE\n\n";
    out << "Options:\n";
    out << "  --lines, -n N          Lines to keep (default: " << DEFAULT_MAX_LINES << ")\n";
    out << "  --partition-size N     Bytes per mapped window (default: " << DEFAULT_PARTITION_SIZE << ")\n";
    out << "  --max-bytes N          Backward scan cap in bytes (default: " << DEFAULT_MAX_BYTES << ")\n";
    out << "  --no-follow            Read once and exit\n";
    out << "  --plain                Print batches to stdout instead of the viewer\n";
    out << "  --json                 Print each batch as one JSON object per line\n";
    out << "  --config FILE          Load options from a JSON file\n";
    out << "  --verbose, -v          Log every mapped partition\n";
    out << "  --help, -h             Show this help message\n\n";
    out << "Example:\n";
    out << "  " << program << " --lines 200 --partition-size 4096 /var/log/syslog\n";
    return out.str();
}

} // namespace map_tail
