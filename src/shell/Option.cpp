#include "shell/Option.hpp"

namespace hs::shell {

namespace {

std::optional<std::string> stripDashes(const std::optional<std::string>& alias) {
    if (!alias) return std::nullopt;
    size_t i = 0;
    while (i < alias->size() && (*alias)[i] == '-') ++i;
    return alias->substr(i);
}

}

std::optional<std::string> OptionDescriptor::shortKey() const { return stripDashes(short_alias); }

std::optional<std::string> OptionDescriptor::longKey() const { return stripDashes(long_alias); }

bool OptionDescriptor::hasKey(const std::string_view key) const {
    const auto s = shortKey(), l = longKey();
    return (s && *s == key) || (l && *l == key);
}

bool OptionDescriptor::hasAlias(const std::string_view alias) const {
    return (short_alias && *short_alias == alias) || (long_alias && *long_alias == alias);
}

bool OptionDescriptor::aliasStartsWith(const std::string_view prefix) const {
    return (short_alias && short_alias->starts_with(prefix)) || (long_alias && long_alias->starts_with(prefix));
}

std::string OptionDescriptor::preferredAlias() const {
    if (long_alias) return *long_alias;
    return short_alias.value_or(std::string{});
}

OptionDescriptor OptionDescriptor::Help() {
    OptionDescriptor d;
    d.name = "help";
    d.short_alias = "-h";
    d.long_alias = "--help";
    d.help = "Prints help information";
    d.required = false;
    d.flag = true;
    d.type_hint = "bool";
    return d;
}

}
