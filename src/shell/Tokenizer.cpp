#include "shell/Tokenizer.hpp"
#include "shell/CommandTree.hpp"
#include "shell/Error.hpp"
#include "shell/Lexer.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace hs::logging;

namespace hs::shell {

namespace {

std::vector<std::string> splitOrThrow(const std::string& line) {
    auto parts = shellSplit(line);
    if (!parts) throw ShellError::invalidInput("unterminated quote or trailing escape");
    return std::move(*parts);
}

// Everything after the command name: options and positionals
void parseArguments(ParsedTokens& out,
                    const std::vector<std::string>& parts,
                    size_t i,
                    const ValueResolver& resolver) {
    bool stop_flags = false;

    for (; i < parts.size(); ++i) {
        const std::string& t = parts[i];

        if (!stop_flags && t == "--") {
            stop_flags = true;
            continue;
        }

        if (!stop_flags && isOptionToken(t)) {
            const bool isLong = t.starts_with("--");
            std::string key = t.substr(isLong ? 2 : 1);
            std::optional<std::string> glued;

            if (isLong) {
                if (const auto eq = key.find('='); eq != std::string::npos) {
                    glued = key.substr(eq + 1);
                    key.erase(eq);
                }
            }

            if (key.empty()) throw ShellError::invalidOption(fmt::format("'{}' has no option name", t));

            std::string value;
            if (glued) value = std::move(*glued);
            else if (i + 1 < parts.size() && !isOptionToken(parts[i + 1])) value = parts[++i];

            // Last one wins for repeated keys
            out.options[key] = value.empty() ? value : resolver.resolve(value);
            continue;
        }

        out.positionals.push_back(t);
    }
}

void traceTokens(const ParsedTokens& t) {
    LogRegistry::shell()->trace("[Tokenizer] scopes=[{}] command='{}' options={} positionals=[{}]",
                                fmt::join(t.scope_path, ", "), t.command_name,
                                t.options.size(), fmt::join(t.positionals, ", "));
}

}

bool isOptionToken(const std::string_view token) {
    return token.starts_with('-') && !looksNegativeNumber(token);
}

bool ParsedTokens::hasOption(const std::string_view key) const {
    return options.contains(std::string(key));
}

std::optional<std::string> ParsedTokens::option(const std::string_view key) const {
    const auto it = options.find(std::string(key));
    if (it == options.end()) return std::nullopt;
    return it->second;
}

ParsedTokens tokenize(const std::string& line, const std::string& resolvedCommand, const ValueResolver& resolver) {
    const auto parts = splitOrThrow(line);
    ParsedTokens out;

    size_t i = 0;
    for (; i < parts.size(); ++i) {
        const auto& t = parts[i];
        if (isOptionToken(t)) break;
        if (t == resolvedCommand) {
            ++i;
            break;
        }
        out.scope_path.push_back(t);
    }
    out.command_name = resolvedCommand;

    parseArguments(out, parts, i, resolver);
    traceTokens(out);
    return out;
}

ParsedTokens tokenize(const std::string& line, const CommandTree& tree, const ValueResolver& resolver) {
    const auto parts = splitOrThrow(line);
    ParsedTokens out;

    const CommandTree* scope = &tree;
    size_t i = 0;
    for (; i < parts.size(); ++i) {
        const auto& t = parts[i];
        if (isOptionToken(t)) break;
        if (const auto* child = scope->getScope(t)) {
            out.scope_path.push_back(t);
            scope = child;
            continue;
        }
        out.command_name = t;
        ++i;
        break;
    }

    parseArguments(out, parts, i, resolver);
    traceTokens(out);
    return out;
}

}
