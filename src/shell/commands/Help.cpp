#include "shell/commands/Help.hpp"
#include "shell/CommandTree.hpp"
#include "shell/LineSink.hpp"

using namespace hs::shell;
using namespace hs::shell::commands;

const OptionTable<Help>& Help::optionTable() {
    static const OptionTable<Help> table = OptionTable<Help>{}
        .field("tree", &Help::tree, {.short_alias = "t", .help = "Command tree", .flag = true});
    return table;
}

std::optional<std::string> Help::about() const { return "List the available commands"; }

std::optional<std::string> Help::examples() const { return "\n--tree"; }

void Help::execute(const CommandContext& ctx, const ParsedTokens& tokens) const {
    if (fromTokens(tokens).tree.value_or(false)) ctx.tree.showTree(ctx.out);
    else ctx.out.appendLine(ctx.tree.summary());
}
