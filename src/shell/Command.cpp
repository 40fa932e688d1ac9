#include "shell/Command.hpp"
#include "shell/Error.hpp"
#include "shell/LineSink.hpp"
#include "shell/util/lineHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace hs::shell;
using namespace hs::logging;

void Command::validate(const ParsedTokens& tokens) const {
    validateMissingOptions(tokens);
    validateDuplicateOptions(tokens);
    validateFlagOptions(tokens);
}

void Command::validateMissingOptions(const ParsedTokens& tokens) const {
    std::vector<std::string> missing;

    for (const auto& opt : options()) {
        if (!opt.required) continue;

        const auto s = opt.shortKey(), l = opt.longKey();
        if (s && tokens.hasOption(*s)) continue;
        if (l && tokens.hasOption(*l)) continue;

        LogRegistry::shell()->trace("[Command] {}: required option '{}' not supplied", name(), opt.name);
        missing.push_back(opt.name);
    }

    if (!missing.empty()) throw ShellError::missingOptions(std::move(missing));
}

void Command::validateDuplicateOptions(const ParsedTokens& tokens) const {
    std::vector<std::string> duplicates;

    for (const auto& opt : options()) {
        const auto s = opt.shortKey(), l = opt.longKey();
        if (s && l && tokens.hasOption(*s) && tokens.hasOption(*l)) duplicates.push_back(opt.name);
    }

    if (!duplicates.empty()) throw ShellError::duplicateOptions(std::move(duplicates));
}

void Command::validateFlagOptions(const ParsedTokens& tokens) const {
    std::vector<std::string> populated;

    for (const auto& opt : options()) {
        if (!opt.flag) continue;

        for (const auto& key : {opt.shortKey(), opt.longKey()}) {
            if (!key) continue;
            if (const auto v = tokens.option(*key); v && !v->empty()) populated.push_back(*key);
        }
    }

    if (!populated.empty()) throw ShellError::populatedFlagOptions(std::move(populated));
}

void Command::help(const std::string& commandName, const std::vector<std::string>& context, LineSink& out) const {
    auto parts = context;
    parts.push_back(commandName);
    const auto fqName = join(parts, " ");

    if (const auto a = about()) out.appendLine(fmt::format("{} - {}", fqName, *a));
    else out.appendLine(fqName);
    out.appendLine("");

    if (const auto la = longAbout()) {
        for (const auto& line : splitLines(*la)) out.appendLine(line);
        out.appendLine("");
    }

    if (const auto& opts = options(); !opts.empty()) {
        size_t shortW = 0, longW = 0, typeW = 0;
        for (const auto& o : opts) {
            shortW = std::max(shortW, o.short_alias ? o.short_alias->size() : 0);
            longW = std::max(longW, o.long_alias ? o.long_alias->size() : 0);
            typeW = std::max(typeW, o.type_hint.size());
        }

        out.appendLine("Options:");
        for (const auto& o : opts) {
            const auto s = o.short_alias ? *o.short_alias + "," : std::string{};
            const auto l = o.long_alias ? *o.long_alias + "," : std::string{};
            out.appendLine(trimRight(fmt::format("  {:<{}} {:<{}} {:<{}} {}{}",
                                                 s, shortW + 3,
                                                 l, longW + 4,
                                                 "<" + o.type_hint + ">", typeW + 2,
                                                 o.help, o.flag ? " (flag)" : "")));
        }
        out.appendLine("");
    }

    if (const auto ex = examples()) {
        out.appendLine("Examples:");
        for (const auto& line : splitLines(*ex)) out.appendLine(trimRight(fmt::format("  {} {}", fqName, line)));
    }
}

const OptionDescriptor* Command::findOptionByAlias(const std::string_view alias) const {
    const auto& opts = options();
    const auto it = std::ranges::find_if(opts, [&](const OptionDescriptor& o) { return o.hasAlias(alias); });
    return it == opts.end() ? nullptr : &*it;
}

const OptionDescriptor* Command::findOptionByKey(const std::string_view key) const {
    const auto& opts = options();
    const auto it = std::ranges::find_if(opts, [&](const OptionDescriptor& o) { return o.hasKey(key); });
    return it == opts.end() ? nullptr : &*it;
}

bool Command::isHelpRequest(const ParsedTokens& tokens) {
    return tokens.hasOption("help") || tokens.hasOption("h");
}
