#pragma once

#include "shell/OptionTable.hpp"

#include <optional>

namespace hs::shell::commands {

class Help final : public BoundCommand<Help> {
public:
    std::optional<bool> tree;

    static const OptionTable<Help>& optionTable();

    [[nodiscard]] std::string name() const override { return "help"; }
    [[nodiscard]] std::optional<std::string> about() const override;
    [[nodiscard]] std::optional<std::string> examples() const override;

    void execute(const CommandContext& ctx, const ParsedTokens& tokens) const override;
};

}
