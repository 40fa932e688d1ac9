#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "shell/CommandTree.hpp"
#include "shell/Completer.hpp"
#include "shell/Dispatcher.hpp"
#include "shell/Error.hpp"
#include "shell/OutputBuffer.hpp"
#include "shell/commands/ConfigShow.hpp"
#include "shell/commands/Help.hpp"

#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <regex>
#include <string>
#include <vector>
#include <fmt/core.h>
#include <readline/history.h>
#include <readline/readline.h>

using namespace hs::config;
using namespace hs::logging;
using namespace hs::shell;

namespace {

const Completer* completer = nullptr;
std::vector<Candidate> candidates;
std::vector<std::string> matches;

char* generator_callback(const char*, const int state) {
    static size_t index = 0;
    if (state == 0) index = 0;
    if (index >= matches.size()) return nullptr;
    return strdup(matches[index++].c_str());
}

char** completion_callback(const char* text, const int start, int) {
    rl_attempted_completion_over = 1;  // never fall back to filename completion

    const std::string line(rl_line_buffer, static_cast<size_t>(rl_end));
    const auto result = completer->complete(line, static_cast<size_t>(rl_point));

    // readline replaces from its own word start; carry over anything between
    // that and where our replacement begins
    const auto wordStart = static_cast<size_t>(start);
    const std::string lead = result.start > wordStart ? line.substr(wordStart, result.start - wordStart) : "";

    candidates = result.candidates;
    matches.clear();
    for (const auto& c : candidates) matches.push_back(lead + c.replacement);

    if (matches.empty()) return nullptr;
    return rl_completion_matches(text, generator_callback);
}

void display_matches(char**, int, int) {
    fmt::print("\n");
    for (const auto& c : candidates) fmt::print("  {}\n", c.display);
    rl_forced_update_display();
}

void install_completion(const Completer& c) {
    completer = &c;
    rl_readline_name = "hubsh";
    rl_completer_word_break_characters = const_cast<char*>(" \t\n");
    rl_attempted_completion_function = completion_callback;
    rl_completion_display_matches_hook = display_matches;
}

void print_usage(const char* prog) {
    fmt::print("usage: {} [--config <file>]\n", prog);
}

bool is_blank(const std::string& s) {
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

void run_line(const Dispatcher& dispatcher, const std::string& line, OutputBuffer& buffer) {
    const auto [command, filter] = splitFilter(line);

    try {
        if (filter) buffer.setFilter(filter->pattern, filter->invert);
        else buffer.clearFilter();

        dispatcher.dispatch(command, buffer);
    } catch (const ShellError& e) {
        LogRegistry::shell()->debug("[repl] {} while running '{}'", to_string(e.kind()), command);
        buffer.addError(e.what());
    } catch (const std::regex_error& e) {
        buffer.addError(fmt::format("Invalid filter '{}': {}", filter ? filter->pattern : "", e.what()));
    } catch (const std::exception& e) {
        LogRegistry::shell()->error("[repl] Command '{}' failed: {}", command, e.what());
        buffer.addError(e.what());
    }

    buffer.flush(std::cout);
}

}

int main(const int argc, char** argv) {
    std::filesystem::path configPath = ConfigRegistry::defaultConfigPath();

    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (a == "--config" || a == "-c") {
            if (i + 1 >= argc) {
                print_usage(argv[0]);
                return 2;
            }
            configPath = argv[++i];
            continue;
        }
        if (a.starts_with("--config=")) {
            configPath = a.substr(9);
            continue;
        }
        fmt::print(stderr, "Unknown argument: {}\n", a);
        print_usage(argv[0]);
        return 2;
    }

    try {
        ConfigRegistry::init(configPath);
        LogRegistry::init(ConfigRegistry::get().logging);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Failed to load configuration from {}: {}\n", configPath.string(), e.what());
        return 1;
    }

    const auto& cnf = ConfigRegistry::get();
    LogRegistry::shell()->info("[repl] Starting hubsh (config: {})", configPath.string());

    CommandTree tree;
    tree.addCommand("help", commands::Help{});
    tree.addScope("config").addCommand("show", commands::ConfigShow{cnf});

    const CurlValueResolver resolver(cnf.remote);
    const Dispatcher dispatcher(tree, nullptr, resolver);
    const Completer lineCompleter(tree, {.value_callbacks = cnf.completion.value_callbacks});
    install_completion(lineCompleter);

    using_history();
    const auto& historyFile = cnf.repl.history_file;
    if (!historyFile.empty()) {
        if (const int rc = read_history(historyFile.c_str()); rc != 0 && rc != ENOENT)
            LogRegistry::shell()->warn("[repl] Could not read history {}: {}", historyFile.string(), std::strerror(rc));
    }

    OutputBuffer buffer;
    while (char* raw = readline(cnf.repl.prompt.c_str())) {
        const std::string line(raw);
        std::free(raw);

        if (is_blank(line)) continue;
        if (line.front() != ' ') add_history(line.c_str());

        run_line(dispatcher, line, buffer);
    }
    fmt::print("\n");

    if (!historyFile.empty()) {
        if (const int rc = write_history(historyFile.c_str()); rc != 0)
            LogRegistry::shell()->warn("[repl] Could not write history {}: {}", historyFile.string(), std::strerror(rc));
    }

    LogRegistry::shell()->info("[repl] Exiting");
    LogRegistry::flushAll();
    return 0;
}
