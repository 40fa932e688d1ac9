#pragma once

#include "shell/Option.hpp"
#include "shell/Tokenizer.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hs::shell {

class CommandTree;
class LineSink;

// Opaque handle to whatever backend the host hands its commands (an API client, a connection).
// The shell core never looks inside.
class Client {
public:
    virtual ~Client() = default;
};

struct CommandContext {
    const CommandTree& tree;
    Client* client;                     // may be null
    LineSink& out;
    std::vector<std::string> scope_path;
};

class Command {
public:
    virtual ~Command() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual const std::vector<OptionDescriptor>& options() const = 0;

    [[nodiscard]] virtual std::optional<std::string> about() const { return std::nullopt; }
    [[nodiscard]] virtual std::optional<std::string> longAbout() const { return std::nullopt; }
    // One invocation per line, without the command name
    [[nodiscard]] virtual std::optional<std::string> examples() const { return std::nullopt; }

    virtual void execute(const CommandContext& ctx, const ParsedTokens& tokens) const = 0;

    // Missing, then duplicate, then flag values. The first failing check throws with
    // its complete list.
    virtual void validate(const ParsedTokens& tokens) const;

    void validateMissingOptions(const ParsedTokens& tokens) const;
    void validateDuplicateOptions(const ParsedTokens& tokens) const;
    void validateFlagOptions(const ParsedTokens& tokens) const;

    virtual void help(const std::string& commandName,
                      const std::vector<std::string>& context,
                      LineSink& out) const;

    // Descriptor owning a dashed alias ("-n", "--name"), or null
    [[nodiscard]] const OptionDescriptor* findOptionByAlias(std::string_view alias) const;
    [[nodiscard]] const OptionDescriptor* findOptionByKey(std::string_view key) const;

    [[nodiscard]] static bool isHelpRequest(const ParsedTokens& tokens);
};

}
