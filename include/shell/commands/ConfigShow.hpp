#pragma once

#include "config/Config.hpp"
#include "shell/OptionTable.hpp"

namespace hs::shell::commands {

// Prints the effective configuration as YAML
class ConfigShow final : public BoundCommand<ConfigShow> {
public:
    ConfigShow() = default;
    explicit ConfigShow(config::Config cnf) : cnf_(std::move(cnf)) {}

    std::optional<std::string> section;

    static const OptionTable<ConfigShow>& optionTable();

    [[nodiscard]] std::string name() const override { return "show"; }
    [[nodiscard]] std::optional<std::string> about() const override;
    [[nodiscard]] std::optional<std::string> examples() const override;

    void execute(const CommandContext& ctx, const ParsedTokens& tokens) const override;

private:
    config::Config cnf_;
};

}
