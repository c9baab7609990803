#include "console_ui.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/color.hpp>
#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <thread>

namespace map_tail {

namespace {

// Rendering more rows than a terminal can show only costs time
constexpr size_t MAX_RENDERED_LINES = 2000;
constexpr size_t LOG_PANE_LINES = 100;
constexpr size_t LOG_HISTORY = 500;
constexpr size_t BUDGET_STEP = 100;

bool parse_line_count(const std::string& value, size_t& out) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

} // namespace

bool SlashCommand::answers_to(const std::string& word) const {
    return word == name || std::find(aliases.begin(), aliases.end(), word) != aliases.end();
}

void LogHistory::push(TailLogLine line) {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
    if (lines_.size() > capacity_) {
        lines_.pop_front();
    }
}

std::vector<TailLogLine> LogHistory::recent(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t skip = lines_.size() > count ? lines_.size() - count : 0;
    return std::vector<TailLogLine>(lines_.begin() + static_cast<std::ptrdiff_t>(skip), lines_.end());
}

size_t LogHistory::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

ConsoleUI::ConsoleUI(const TailConfig& config, LineBudget& budget)
    : config_(config)
    , budget_(budget)
    , history_(LOG_HISTORY)
{
}

void ConsoleUI::refresh_screen() {
    if (auto* screen = screen_.load()) {
        screen->Post(ftxui::Event::Custom);
    }
}

void ConsoleUI::on_lines(std::vector<std::string> lines) {
    {
        std::lock_guard<std::mutex> lock(lines_mutex_);
        if (paused_) {
            pending_ = std::move(lines);
            has_pending_ = true;
        } else {
            lines_ = std::move(lines);
        }
    }
    batches_++;
    refresh_screen();
}

void ConsoleUI::report_error(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = message;
    }
    log_message("Tail", message, LogLevel::Error);
}

void ConsoleUI::clear_error() {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_.clear();
}

std::string ConsoleUI::error_banner() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

std::vector<std::string> ConsoleUI::snapshot() const {
    std::lock_guard<std::mutex> lock(lines_mutex_);
    return lines_;
}

void ConsoleUI::log_message(const std::string& component,
                            const std::string& message, LogLevel level) {
    history_.push(TailLogLine{level, component, message});
    refresh_screen();
}

TailLog::Sink ConsoleUI::get_log_sink() {
    return [this](LogLevel level, const std::string& component, const std::string& message) {
        log_message(component, message, level);
    };
}

void ConsoleUI::set_max_lines(size_t lines) {
    budget_.set_max_lines(lines);
    log_message("Lines", "Showing up to " + std::to_string(budget_.max_lines()) + " lines");
    if (tail_) {
        tail_->refresh();
    }
}

void ConsoleUI::toggle_pause() {
    std::lock_guard<std::mutex> lock(lines_mutex_);
    paused_ = !paused_;
    if (!paused_ && has_pending_) {
        lines_ = std::move(pending_);
        pending_.clear();
        has_pending_ = false;
    }
}

void ConsoleUI::show_help() {
    log_message("Help", "Commands (Tab completes, Esc dismisses errors):");
    for (const auto& command : commands_) {
        std::string names = "/" + command.name;
        for (const auto& alias : command.aliases) {
            names += ", /" + alias;
        }
        if (!command.usage.empty()) {
            names += " " + command.usage;
        }
        log_message("Help", "  " + names + " - " + command.description);
    }
}

void ConsoleUI::init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen) {
    using Args = std::vector<std::string>;
    commands_ = {
        {"quit", {"q"}, "", "Exit", [&running, &screen](ConsoleUI&, const Args&) {
            running = false;
            screen.Exit();
        }},
        {"pause", {"p"}, "", "Freeze the tail pane", [](ConsoleUI& ui, const Args&) {
            ui.toggle_pause();
        }},
        {"lines", {}, "<n>", "Keep the last n lines", [](ConsoleUI& ui, const Args& args) {
            size_t count = 0;
            if (args.size() != 1 || !parse_line_count(args[0], count)) {
                ui.log_message("Lines", "Usage: /lines <n>", LogLevel::Error);
                return;
            }
            ui.set_max_lines(count);
        }},
        {"more", {}, "", "Grow the line budget", [](ConsoleUI& ui, const Args&) {
            ui.set_max_lines(ui.budget_.max_lines() + BUDGET_STEP);
        }},
        {"less", {}, "", "Shrink the line budget", [](ConsoleUI& ui, const Args&) {
            size_t current = ui.budget_.max_lines();
            ui.set_max_lines(current > BUDGET_STEP ? current - BUDGET_STEP : 1);
        }},
        {"dismiss", {}, "", "Hide the error banner", [](ConsoleUI& ui, const Args&) {
            ui.clear_error();
        }},
        {"help", {"h"}, "", "Show this help", [](ConsoleUI& ui, const Args&) {
            ui.show_help();
        }},
    };
}

void ConsoleUI::execute_command() {
    std::string input = command_input_;
    command_input_.clear();
    update_completion_hint();

    if (!input.empty() && input[0] == '/') {
        input.erase(0, 1);
    }
    std::istringstream words(input);
    std::string name;
    if (!(words >> name)) return;

    std::vector<std::string> args;
    for (std::string arg; words >> arg;) {
        args.push_back(arg);
    }

    for (const auto& command : commands_) {
        if (command.answers_to(name)) {
            command.handler(*this, args);
            return;
        }
    }
    log_message("Command", "Unknown command: /" + name + " (try /help)", LogLevel::Error);
}

std::vector<std::string> ConsoleUI::matching_commands(const std::string& prefix) const {
    std::vector<std::string> matches;
    for (const auto& command : commands_) {
        if (command.name.compare(0, prefix.size(), prefix) == 0) {
            matches.push_back(command.name);
        }
    }
    return matches;
}

void ConsoleUI::complete_command() {
    if (command_input_.empty()) {
        command_input_ = "/";
    } else if (command_input_[0] == '/' && command_input_.find(' ') == std::string::npos) {
        auto matches = matching_commands(command_input_.substr(1));
        if (!matches.empty()) {
            // Extend to the longest prefix shared by every match
            std::string common = matches[0];
            for (const auto& match : matches) {
                auto diff = std::mismatch(common.begin(), common.end(), match.begin(), match.end());
                common.erase(diff.first, common.end());
            }
            command_input_ = "/" + common;
        }
    }
    update_completion_hint();
}

void ConsoleUI::update_completion_hint() {
    if (command_input_.empty()) {
        completion_hint_ = "Type /help for commands";
        return;
    }
    if (command_input_[0] != '/') {
        completion_hint_ = "Commands start with /";
        return;
    }
    std::string word = command_input_.substr(1);
    if (word.find(' ') != std::string::npos) {
        completion_hint_.clear();
        return;
    }

    for (const auto& command : commands_) {
        if (command.answers_to(word)) {
            completion_hint_ = command.usage.empty() ? command.description : command.usage;
            return;
        }
    }
    auto matches = matching_commands(word);
    if (matches.empty()) {
        completion_hint_ = "(no match)";
        return;
    }
    completion_hint_.clear();
    for (const auto& match : matches) {
        completion_hint_ += (completion_hint_.empty() ? "" : ", ") + match;
    }
}

void ConsoleUI::run(std::atomic<bool>& running) {
    using namespace ftxui;

    auto screen = ScreenInteractive::Fullscreen();
    screen_ = &screen;

    init_commands(running, screen);
    update_completion_hint();

    const std::string file_name = std::filesystem::path(config_.path).filename().string();

    auto input_option = InputOption::Default();
    input_option.transform = [](InputState state) {
        state.element |= color(Color::White);
        return state.element;
    };
    auto input_component = Input(&command_input_, "", input_option);

    auto command_input_handler = CatchEvent(input_component, [this](Event event) {
        if (event == Event::Tab) {
            complete_command();
            return true;
        }
        if (event == Event::Escape) {
            // First Escape dismisses an error banner, the next clears the input
            if (!error_banner().empty()) {
                clear_error();
            } else {
                command_input_.clear();
                update_completion_hint();
            }
            return true;
        }
        if (event == Event::Return) {
            execute_command();
            return true;
        }
        return false;
    });

    // Runs after the input has consumed the character
    auto command_with_hints = CatchEvent(command_input_handler, [this](Event event) {
        if (event.is_character() || event == Event::Backspace || event == Event::Delete) {
            update_completion_hint();
        }
        return false;
    });

    auto main_content = Renderer([this, &file_name]() {
        auto lines = snapshot();
        SessionState state = tail_ ? tail_->state() : SessionState::Idle;

        auto top_bar = hbox({
            text(" map_tail ") | bold | color(Color::Cyan),
            text(file_name) | bold,
            text("  " + config_.path) | dim,
            filler(),
            text(std::to_string(lines.size()) + "/" + std::to_string(budget_.max_lines()) + " lines") | dim,
            text(" │ ") | dim,
            text(session_state_to_string(state)) |
                color(state == SessionState::Watching ? Color::Green : Color::Yellow),
            text(" │ ") | dim,
            text(std::to_string(batches_.load()) + " reads") | dim,
            text(" "),
        });

        Elements tail_elements;
        size_t start_idx = lines.size() > MAX_RENDERED_LINES ? lines.size() - MAX_RENDERED_LINES : 0;
        for (size_t i = start_idx; i < lines.size(); ++i) {
            tail_elements.push_back(text(lines[i]));
        }

        auto tail_pane = vbox({
            hbox({
                text(" Tail ") | bold,
                filler(),
                text("(" + std::to_string(lines.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(tail_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border;

        Elements log_elements;
        for (const auto& line : history_.recent(LOG_PANE_LINES)) {
            auto style = line.level == LogLevel::Error ? color(Color::Red)
                       : line.level == LogLevel::Debug ? dim : nothing;
            log_elements.push_back(paragraph("[" + line.component + "] " + line.message) | style);
        }

        auto log_pane = vbox({
            hbox({
                text(" Log ") | bold,
                filler(),
                text("(" + std::to_string(history_.size()) + ")") | dim,
            }),
            separator() | color(Color::GrayDark),
            vbox(std::move(log_elements)) | focusPositionRelative(0, 1) | vscroll_indicator | yframe | flex,
        }) | flex | border | color(Color::GrayDark);

        Elements rows;
        rows.push_back(top_bar);

        std::string banner = error_banner();
        if (!banner.empty()) {
            rows.push_back(hbox({
                text(" " + banner + " ") | bold,
                filler(),
                text(" Esc to dismiss ") | dim,
            }) | bgcolor(Color::Red) | color(Color::White));
        }

        rows.push_back(hbox({
            tail_pane | flex,
            log_pane | size(WIDTH, EQUAL, 40),
        }) | flex);

        return vbox(std::move(rows));
    });

    auto cmd_bar = Renderer(command_with_hints, [this, &input_component]() {
        return hbox({
            text(" > ") | bold | color(Color::GrayLight),
            input_component->Render() | size(WIDTH, GREATER_THAN, 20),
            filler(),
            paused_ ? (text(" PAUSED ") | bgcolor(Color::Yellow) | color(Color::Black)) : text(""),
            text(completion_hint_) | dim | color(Color::GrayDark),
            text(" "),
        });
    });

    auto main_layout = Renderer(command_with_hints, [&main_content, &cmd_bar]() {
        return vbox({
            main_content->Render() | flex,
            separator() | color(Color::GrayDark),
            cmd_bar->Render() | size(HEIGHT, EQUAL, 1),
        });
    });

    // Leave the loop when a signal clears the running flag
    std::atomic<bool> watch_running{true};
    std::thread exit_watch([&running, &watch_running, &screen]() {
        while (watch_running && running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (!running) {
            screen.Exit();
        }
    });

    screen.Loop(main_layout);

    watch_running = false;
    exit_watch.join();
    screen_ = nullptr;
}

} // namespace map_tail
