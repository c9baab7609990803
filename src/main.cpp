#include "console_ui.hpp"
#include "errors.hpp"
#include "file_tail.hpp"
#include "line_budget.hpp"
#include "tail_config.hpp"
#include "tail_log.hpp"

#include <nlohmann/json.hpp>
#include <iostream>
#include <csignal>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace map_tail;

std::atomic<bool> running{true};

void signal_handler(int) {
    running = false;
}

namespace {

int run_viewer(const TailConfig& config, LineBudget& budget) {
    ConsoleUI ui(config, budget);
    TailLog::set_sink(ui.get_log_sink());

    TailLog::debug("Main", "Configuration: " + config.to_json().dump());
    {
        FileTail tail(
            config.path,
            [&ui](std::vector<std::string> lines) { ui.on_lines(std::move(lines)); },
            [&budget]() { return budget.max_lines(); },
            [&ui](const std::string& message) { ui.report_error(message); },
            config.max_bytes, config.partition_size);
        ui.attach(&tail);

        tail.start([&config](bool ok) {
            if (!ok) {
                TailLog::error("Main", "Initial read of " + config.path + " failed");
            } else {
                TailLog::log("Main", "Tailing " + config.path);
            }
        }, config.follow);

        ui.run(running);

        ui.attach(nullptr);
        tail.stop();
    }

    TailLog::set_sink(nullptr);
    return 0;
}

int run_printer(const TailConfig& config, LineBudget& budget) {
    TailLog::set_sink(TailLog::stderr_sink);

    std::mutex out_mutex;
    auto print_batch = [&config, &out_mutex](std::vector<std::string> lines) {
        std::lock_guard<std::mutex> lock(out_mutex);
        if (config.mode == OutputMode::Json) {
            nlohmann::json batch = {
                {"path", config.path},
                {"count", lines.size()},
                {"lines", std::move(lines)}
            };
            std::cout << batch.dump() << std::endl;
        } else {
            std::cout << "==> " << config.path << " <==" << "\n";
            for (const auto& line : lines) {
                std::cout << line << "\n";
            }
            std::cout << std::flush;
        }
    };

    FileTail tail(
        config.path,
        print_batch,
        [&budget]() { return budget.max_lines(); },
        [](const std::string& message) { std::cerr << "Error: " << message << std::endl; },
        config.max_bytes, config.partition_size);

    std::promise<bool> initial;
    auto initial_result = initial.get_future();
    tail.start([&initial](bool ok) { initial.set_value(ok); }, config.follow);

    bool ok = initial_result.get();
    if (!ok || !config.follow) {
        tail.stop();
        return ok ? 0 : 1;
    }

    while (running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    tail.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    CommandLine command_line;
    try {
        command_line = parse_command_line(std::vector<std::string>(argv + 1, argv + argc));
        if (command_line.show_help) {
            std::cout << usage(argv[0]);
            return 0;
        }
        command_line.config.validate();
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 1;
    }

    const TailConfig& config = command_line.config;
    TailLog::set_threshold(config.verbose ? LogLevel::Debug : LogLevel::Info);

    // Setup signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    LineBudget budget(config.max_lines);

    try {
        if (config.mode == OutputMode::Ui) {
            return run_viewer(config, budget);
        }
        TailLog::set_sink(TailLog::stderr_sink);
        TailLog::debug("Main", "Configuration: " + config.to_json().dump());
        return run_printer(config, budget);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
