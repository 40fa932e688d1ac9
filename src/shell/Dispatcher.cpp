#include "shell/Dispatcher.hpp"
#include "shell/Command.hpp"
#include "shell/CommandTree.hpp"
#include "shell/Error.hpp"
#include "shell/Lexer.hpp"
#include "shell/Tokenizer.hpp"
#include "shell/util/lineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <ranges>

using namespace hs::shell;
using namespace hs::logging;

namespace {

std::string trim(const std::string& s) {
    std::size_t b = 0;
    while (b < s.size() && isShellSpace(s[b])) ++b;
    return trimRight(s.substr(b));
}

}

FilteredLine hs::shell::splitFilter(const std::string& line) {
    char quote = 0;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (quote) {
            if (c == '\\' && quote == '"') ++i;
            else if (c == quote) quote = 0;
            continue;
        }
        if (c == '\\') {
            ++i;
            continue;
        }
        if (c == '\'' || c == '"') {
            quote = c;
            continue;
        }
        if (c != '|') continue;

        FilteredLine out{trim(line.substr(0, i)), OutputFilter{}};
        auto pattern = trim(line.substr(i + 1));
        if (pattern.starts_with('!')) {
            out.filter->invert = true;
            pattern = trim(pattern.substr(1));
        }
        out.filter->pattern = std::move(pattern);
        return out;
    }

    return {line, std::nullopt};
}

Dispatcher::Dispatcher(const CommandTree& tree, Client* client, const ValueResolver& resolver)
    : tree_(tree), client_(client), resolver_(resolver) {}

Dispatcher::Resolved Dispatcher::resolve(const std::vector<std::string>& parts) const {
    Resolved r;
    const CommandTree* scope = &tree_;

    for (const auto& part : parts) {
        if (const auto* child = scope->getScope(part)) {
            r.scope_path.push_back(part);
            scope = child;
            continue;
        }
        if (const auto* cmd = scope->getCommand(part)) {
            r.command = cmd;
            r.name = part;
            return r;
        }
        throw ShellError::commandNotFound(part);
    }

    throw ShellError::commandNotFound(join(parts, " "));
}

void Dispatcher::dispatch(const std::string& line, LineSink& out) const {
    const auto parts = shellSplit(line);
    if (!parts) throw ShellError::invalidInput("unterminated quote or trailing escape");
    if (parts->empty()) return;

    const auto r = resolve(*parts);
    LogRegistry::shell()->debug("[Dispatcher] Executing command: [{}] {}", fmt::join(r.scope_path, " "), r.name);

    const auto tokens = tokenize(line, tree_, resolver_);

    if (Command::isHelpRequest(tokens)) {
        r.command->help(r.name, r.scope_path, out);
        return;
    }

    for (const auto& key : tokens.getOptions() | std::views::keys)
        if (!r.command->findOptionByKey(key))
            throw ShellError::invalidOption(fmt::format("'{}' is not an option of '{}'", key, r.name));

    r.command->validate(tokens);
    r.command->execute({tree_, client_, out, r.scope_path}, tokens);
}
