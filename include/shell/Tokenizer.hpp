#pragma once

#include "shell/ValueResolver.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hs::shell {

class CommandTree;

struct ParsedTokens {
    std::vector<std::string> scope_path;
    std::string command_name;
    std::map<std::string, std::string> options;  // dash-stripped key -> value ("" for flags)
    std::vector<std::string> positionals;

    [[nodiscard]] const std::map<std::string, std::string>& getOptions() const { return options; }
    [[nodiscard]] const std::vector<std::string>& getPositionals() const { return positionals; }

    [[nodiscard]] bool hasOption(std::string_view key) const;
    [[nodiscard]] std::optional<std::string> option(std::string_view key) const;
};

// The caller already walked the tree: leading non-option tokens up to the first
// occurrence of resolvedCommand form the scope path.
ParsedTokens tokenize(const std::string& line,
                      const std::string& resolvedCommand,
                      const ValueResolver& resolver = CurlValueResolver::defaults());

// Leading tokens naming scopes of the tree extend the scope path; the first
// non-option token that is not a scope is the command name.
ParsedTokens tokenize(const std::string& line,
                      const CommandTree& tree,
                      const ValueResolver& resolver = CurlValueResolver::defaults());

// Option key shape: leading '-' and not a negative number
[[nodiscard]] bool isOptionToken(std::string_view token);

}
