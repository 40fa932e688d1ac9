#include "shell/Completer.hpp"
#include "shell/CommandTree.hpp"
#include "shell/Lexer.hpp"
#include "shell/util/lineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace hs::shell;
using namespace hs::logging;

namespace {

// "--name=acme" -> "--name"
std::string_view aliasPart(const std::string_view token) {
    if (const auto eq = token.find('='); eq != std::string_view::npos) return token.substr(0, eq);
    return token;
}

bool contains(const std::vector<const OptionDescriptor*>& seen, const OptionDescriptor* d) {
    return std::ranges::find(seen, d) != seen.end();
}

}

Completer::Completer(const CommandTree& tree, const CompleterOptions opts) : tree_(tree), opts_(opts) {}

CompletionResult Completer::complete(const std::string& line, std::size_t cursor) const {
    cursor = std::min(cursor, line.size());
    try {
        return completeUnchecked(line, cursor);
    } catch (const std::exception& e) {
        LogRegistry::completion()->warn("[Completer] Completion failed for '{}': {}", line, e.what());
        return {cursor, {}};
    }
}

CompletionResult Completer::completeUnchecked(const std::string& line, const std::size_t cursor) const {
    const std::string prefix = line.substr(0, cursor);

    std::size_t start = prefix.size();
    while (start > 0 && !isShellSpace(prefix[start - 1])) --start;
    const std::string word = prefix.substr(start);

    LogRegistry::completion()->trace("[Completer] line='{}' cursor={} start={} word='{}'", line, cursor, start, word);

    const auto split = shellSplit(prefix);
    if (!split) {
        LogRegistry::completion()->trace("[Completer] Unsplittable prefix, no candidates");
        return {cursor, {}};
    }

    const auto& parts = *split;

    // The current word as the lexer sees it: unquoted, or absent when it is a comment
    std::size_t done = parts.size();
    std::string current;
    if (!word.empty()) {
        const auto head = shellSplit(prefix.substr(0, start));
        const bool produced = !head || parts.size() > head->size() ||
                              (!parts.empty() && parts.back() != head->back());
        if (!produced || parts.empty()) {
            LogRegistry::completion()->trace("[Completer] Cursor is inside a comment, no candidates");
            return {cursor, {}};
        }
        done = parts.size() - 1;
        current = parts.back();
    }

    // Walk the finished tokens through the tree
    const CommandTree* scope = &tree_;
    const Command* cmd = nullptr;
    std::size_t argsFrom = done;
    for (std::size_t i = 0; i < done; ++i) {
        if (const auto* child = scope->getScope(parts[i])) {
            scope = child;
            continue;
        }
        if (const auto* c = scope->getCommand(parts[i])) {
            cmd = c;
            argsFrom = i + 1;
        } else {
            LogRegistry::completion()->trace("[Completer] Unknown token '{}', stopping walk", parts[i]);
        }
        break;
    }

    CompletionResult result{start, {}};

    if (!cmd) {
        for (auto& name : scope->completions(current)) result.candidates.push_back({name, name});
        return result;
    }

    std::vector<const OptionDescriptor*> seen;
    for (std::size_t i = argsFrom; i < done; ++i) {
        if (!parts[i].starts_with('-')) continue;
        if (const auto* d = cmd->findOptionByAlias(aliasPart(parts[i])); d && !contains(seen, d)) seen.push_back(d);
    }

    // --key=partial completes the value in place
    if (const auto eq = current.find('='); current.starts_with("--") && eq != std::string::npos) {
        const auto* opt = cmd->findOptionByAlias(current.substr(0, eq));
        if (!opt || opt->flag || !opt->autocomplete || !opts_.value_callbacks) return result;

        const auto value = current.substr(eq + 1);
        const auto glued = current.substr(0, eq + 1);
        for (const auto& v : opt->autocomplete(tree_, value, parts))
            if (v.starts_with(value)) result.candidates.push_back({v, glued + v});
        return result;
    }

    if (current.starts_with('-')) {
        result.candidates = optionCandidates(*cmd, seen, current);
        return result;
    }

    const OptionDescriptor* prev = done > argsFrom ? cmd->findOptionByAlias(parts[done - 1]) : nullptr;

    if (!prev || prev->flag) {
        result.candidates = optionCandidates(*cmd, seen, current);
        return result;
    }

    if (!prev->autocomplete || !opts_.value_callbacks) return result;

    const auto values = prev->autocomplete(tree_, current, parts);
    LogRegistry::completion()->trace("[Completer] {} suggested [{}]", prev->preferredAlias(), fmt::join(values, ", "));

    // The value slot already holds a complete suggestion: offer the next option
    // after it instead of re-offering values
    if (!current.empty() && std::ranges::find(values, current) != values.end()) {
        result.start = cursor;
        for (auto& c : optionCandidates(*cmd, seen, "")) {
            c.replacement = " " + c.replacement;
            result.candidates.push_back(std::move(c));
        }
        return result;
    }

    for (const auto& v : values)
        if (v.starts_with(current)) result.candidates.push_back({v, v});
    return result;
}

std::vector<Candidate> Completer::optionCandidates(const Command& cmd,
                                                   const std::vector<const OptionDescriptor*>& seen,
                                                   const std::string& word) {
    std::vector<const OptionDescriptor*> remaining;
    for (const auto& opt : cmd.options()) {
        if (contains(seen, &opt)) continue;
        if (!word.empty() && !opt.aliasStartsWith(word)) continue;
        remaining.push_back(&opt);
    }

    std::size_t shortW = 0, longW = 0, typeW = 0;
    for (const auto* o : remaining) {
        shortW = std::max(shortW, o->short_alias ? o->short_alias->size() : 0);
        longW = std::max(longW, o->long_alias ? o->long_alias->size() : 0);
        typeW = std::max(typeW, o->type_hint.size() + 2);
    }

    std::vector<Candidate> out;
    for (const auto* o : remaining) {
        auto display = fmt::format("{:<{}} {:<{}} {:<{}} {}",
                                   o->short_alias.value_or(""), shortW,
                                   o->long_alias.value_or(""), longW,
                                   "<" + o->type_hint + ">", typeW,
                                   o->help);
        out.push_back({trimRight(std::move(display)), o->preferredAlias()});
    }
    return out;
}
