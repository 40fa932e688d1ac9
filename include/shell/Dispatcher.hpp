#pragma once

#include "shell/ValueResolver.hpp"

#include <optional>
#include <string>
#include <vector>

namespace hs::shell {

class Client;
class Command;
class CommandTree;
class LineSink;

struct OutputFilter {
    std::string pattern;
    bool invert = false;
};

struct FilteredLine {
    std::string command;
    std::optional<OutputFilter> filter;
};

// Splits "cmd ... | pattern" (or "| !pattern") at the first '|' outside quotes
[[nodiscard]] FilteredLine splitFilter(const std::string& line);

// Submit path: resolve, tokenize, then help or validate + execute
class Dispatcher {
public:
    struct Resolved {
        const Command* command = nullptr;
        std::string name;
        std::vector<std::string> scope_path;
    };

    explicit Dispatcher(const CommandTree& tree,
                        Client* client = nullptr,
                        const ValueResolver& resolver = CurlValueResolver::defaults());

    // Throws ShellError(CommandNotFound) unless the walk ends on a command
    [[nodiscard]] Resolved resolve(const std::vector<std::string>& parts) const;

    // Blank lines are a no-op. Option keys the command does not declare are
    // InvalidOption. Every failure propagates as ShellError (or whatever the
    // command body throws).
    void dispatch(const std::string& line, LineSink& out) const;

private:
    const CommandTree& tree_;
    Client* client_;
    const ValueResolver& resolver_;
};

}
