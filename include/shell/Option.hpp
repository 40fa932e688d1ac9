#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hs::shell {

class CommandTree;

// Value suggestions for one option: (tree, prefix being typed, every token on the line).
// Implementations that do I/O swallow their own failures and return an empty list.
using AutocompleteFn = std::function<std::vector<std::string>(const CommandTree&,
                                                              const std::string& prefix,
                                                              const std::vector<std::string>& tokens)>;

struct OptionDescriptor {
    std::string name;                       // unique per command, e.g. "name"
    std::optional<std::string> short_alias; // "-n"
    std::optional<std::string> long_alias;  // "--name"
    std::string help;
    bool required = true;
    bool flag = false;
    std::string type_hint;                  // "string", "option<bool>", ...
    AutocompleteFn autocomplete = nullptr;

    // Aliases without their leading dashes: the keys ParsedTokens stores
    [[nodiscard]] std::optional<std::string> shortKey() const;
    [[nodiscard]] std::optional<std::string> longKey() const;

    [[nodiscard]] bool hasKey(std::string_view key) const;
    [[nodiscard]] bool hasAlias(std::string_view alias) const;
    [[nodiscard]] bool aliasStartsWith(std::string_view prefix) const;

    // Long alias if present, else the short one
    [[nodiscard]] std::string preferredAlias() const;

    static OptionDescriptor Help();
};

}
