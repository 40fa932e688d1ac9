#pragma once

#include "shell/Command.hpp"

#include <concepts>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace hs::shell {

class LineSink;

// One level of the command hierarchy: leaf commands and nested scopes, each keyed
// by name. Built once at startup and read-only afterwards.
class CommandTree {
public:
    CommandTree() = default;
    CommandTree(const CommandTree&) = delete;
    CommandTree& operator=(const CommandTree&) = delete;

    // Inserts or replaces; returns this level for chaining.
    // Throws std::runtime_error if a scope of the same name exists here.
    CommandTree& addCommand(const std::string& name, std::shared_ptr<Command> command);

    template<std::derived_from<Command> T>
    CommandTree& addCommand(const std::string& name, T command) {
        return addCommand(name, std::make_shared<T>(std::move(command)));
    }

    // Returns the child scope, created empty if absent.
    // Throws std::runtime_error if a command of the same name exists here.
    CommandTree& addScope(const std::string& name);

    [[nodiscard]] const Command* getCommand(std::string_view name) const;
    [[nodiscard]] const CommandTree* getScope(std::string_view name) const;

    [[nodiscard]] std::vector<std::string> commandNames() const;
    [[nodiscard]] std::vector<std::string> scopeNames() const;
    [[nodiscard]] bool empty() const { return commands_.empty() && scopes_.empty(); }

    // Commands then scopes at this level whose name starts with prefix
    [[nodiscard]] std::vector<std::string> completions(std::string_view prefix) const;

    // Commands first, then scopes, recursively, drawn with ├─ └─ │ connectors
    [[nodiscard]] std::string showTree() const;
    void showTree(LineSink& out) const;

    // "Commands: a, b. Scopes: c, d."
    [[nodiscard]] std::string summary() const;

private:
    std::map<std::string, std::shared_ptr<Command>, std::less<>> commands_;
    std::map<std::string, std::unique_ptr<CommandTree>, std::less<>> scopes_;

    void generateTree(const std::string& prefix, std::vector<std::string>& lines) const;
};

}
