#include "shell/commands/ConfigShow.hpp"
#include "shell/LineSink.hpp"
#include "shell/autocomplete.hpp"
#include "shell/util/lineHelpers.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

using namespace hs::shell;
using namespace hs::shell::commands;

const OptionTable<ConfigShow>& ConfigShow::optionTable() {
    static const OptionTable<ConfigShow> table = OptionTable<ConfigShow>{}
        .field("section", &ConfigShow::section, {
            .short_alias = "s",
            .help = "Only print this section",
            .autocomplete = autocomplete::oneOf({"logging", "completion", "remote", "repl"}),
        });
    return table;
}

std::optional<std::string> ConfigShow::about() const { return "Show the active configuration"; }

std::optional<std::string> ConfigShow::examples() const { return "\n--section remote"; }

void ConfigShow::execute(const CommandContext& ctx, const ParsedTokens& tokens) const {
    const auto args = fromTokens(tokens);
    auto text = config::dumpConfig(cnf_);

    if (args.section) {
        const YAML::Node root = YAML::Load(text);
        const auto node = root[*args.section];
        if (!node) throw ShellError::invalidOption(fmt::format("unknown config section '{}'", *args.section));
        YAML::Emitter out;
        out << node;
        text = out.c_str();
    }

    for (const auto& line : splitLines(text)) ctx.out.appendLine(line);
}
