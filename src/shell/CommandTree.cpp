#include "shell/CommandTree.hpp"
#include "shell/LineSink.hpp"
#include "shell/util/lineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <ranges>
#include <stdexcept>

using namespace hs::shell;
using namespace hs::logging;

CommandTree& CommandTree::addCommand(const std::string& name, std::shared_ptr<Command> command) {
    if (!command) throw std::invalid_argument("Command '" + name + "' is null");
    if (scopes_.contains(name))
        throw std::runtime_error("Cannot register command '" + name + "': a scope with that name exists");

    LogRegistry::shell()->debug("[CommandTree] Adding command: {}", name);
    commands_[name] = std::move(command);
    return *this;
}

CommandTree& CommandTree::addScope(const std::string& name) {
    if (commands_.contains(name))
        throw std::runtime_error("Cannot register scope '" + name + "': a command with that name exists");

    auto& slot = scopes_[name];
    if (!slot) {
        LogRegistry::shell()->debug("[CommandTree] Adding scope: {}", name);
        slot = std::make_unique<CommandTree>();
    }
    return *slot;
}

const Command* CommandTree::getCommand(const std::string_view name) const {
    const auto it = commands_.find(name);
    return it == commands_.end() ? nullptr : it->second.get();
}

const CommandTree* CommandTree::getScope(const std::string_view name) const {
    const auto it = scopes_.find(name);
    return it == scopes_.end() ? nullptr : it->second.get();
}

std::vector<std::string> CommandTree::commandNames() const {
    std::vector<std::string> out;
    for (const auto& name : commands_ | std::views::keys) out.push_back(name);
    return out;
}

std::vector<std::string> CommandTree::scopeNames() const {
    std::vector<std::string> out;
    for (const auto& name : scopes_ | std::views::keys) out.push_back(name);
    return out;
}

std::vector<std::string> CommandTree::completions(const std::string_view prefix) const {
    std::vector<std::string> out;
    for (const auto& name : commands_ | std::views::keys)
        if (name.starts_with(prefix)) out.push_back(name);
    for (const auto& name : scopes_ | std::views::keys)
        if (name.starts_with(prefix)) out.push_back(name);
    return out;
}

void CommandTree::generateTree(const std::string& prefix, std::vector<std::string>& lines) const {
    const size_t total = commands_.size() + scopes_.size();
    size_t i = 0;

    for (const auto& name : commands_ | std::views::keys) {
        const bool last = ++i == total;
        lines.push_back(prefix + (last ? "└─ " : "├─ ") + name);
    }

    for (const auto& [name, scope] : scopes_) {
        const bool last = ++i == total;
        lines.push_back(prefix + (last ? "└─ " : "├─ ") + name);
        scope->generateTree(prefix + (last ? "   " : "│  "), lines);
    }
}

std::string CommandTree::showTree() const {
    std::vector<std::string> lines;
    generateTree("", lines);

    std::string out;
    for (const auto& line : lines) out += line + '\n';
    return out;
}

void CommandTree::showTree(LineSink& out) const {
    std::vector<std::string> lines;
    generateTree("", lines);
    for (const auto& line : lines) out.appendLine(line);
}

std::string CommandTree::summary() const {
    return fmt::format("Commands: {}. Scopes: {}.", join(commandNames(), ", "), join(scopeNames(), ", "));
}
