#pragma once

#include "shell/Command.hpp"
#include "shell/Error.hpp"

#include <charconv>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

namespace hs::shell {

namespace detail {

template<typename T> struct is_optional : std::false_type {};
template<typename T> struct is_optional<std::optional<T>> : std::true_type {};
template<typename T> inline constexpr bool is_optional_v = is_optional<T>::value;

template<typename T> struct TypeName;
template<> struct TypeName<std::string>    { static std::string get() { return "string"; } };
template<> struct TypeName<bool>           { static std::string get() { return "bool"; } };
template<> struct TypeName<int32_t>        { static std::string get() { return "i32"; } };
template<> struct TypeName<int64_t>        { static std::string get() { return "i64"; } };
template<> struct TypeName<uint32_t>       { static std::string get() { return "u32"; } };
template<> struct TypeName<uint64_t>       { static std::string get() { return "u64"; } };
template<> struct TypeName<double>         { static std::string get() { return "f64"; } };
template<> struct TypeName<nlohmann::json> { static std::string get() { return "json"; } };

template<typename T> struct TypeName<std::optional<T>> {
    static std::string get() { return "option<" + TypeName<T>::get() + ">"; }
};

template<typename T>
bool parseValue(const std::string& s, T& out) {
    if constexpr (std::is_same_v<T, std::string>) {
        out = s;
        return true;
    } else if constexpr (std::is_same_v<T, bool>) {
        if (s == "true") out = true;
        else if (s == "false") out = false;
        else return false;
        return true;
    } else if constexpr (std::is_arithmetic_v<T>) {
        if (s.empty()) return false;
        const char* first = s.data();
        const char* last = s.data() + s.size();
        if (*first == '+' && last - first > 1 && first[1] != '-') ++first;
        const auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc() && ptr == last;
    } else if constexpr (std::is_same_v<T, nlohmann::json>) {
        auto j = nlohmann::json::parse(s, nullptr, false);
        if (j.is_discarded()) return false;
        out = std::move(j);
        return true;
    } else {
        static_assert(sizeof(T) == 0, "unsupported option field type");
    }
}

template<typename T>
void assignField(T& out, const std::string& key, const std::string& value, const OptionDescriptor& d) {
    if constexpr (is_optional_v<T>) {
        typename T::value_type v{};
        assignField(v, key, value, d);
        out = std::move(v);
    } else {
        if constexpr (std::is_same_v<T, bool>) {
            if (d.flag && value.empty()) {
                out = true;
                return;
            }
        }
        if (!parseValue(value, out)) throw ShellError::parseError(key, value, d.type_hint);
    }
}

}

// Aliases are given without dashes: {.short_alias = "n", .long_alias = "name"}.
// An empty long_alias defaults to the field name.
struct FieldSpec {
    std::string short_alias;
    std::string long_alias;
    std::string help;
    std::optional<bool> required;   // unset: true unless the member is std::optional
    bool flag = false;
    AutocompleteFn autocomplete = nullptr;
};

// Static registration of a command type's options against its data members.
// The implicit help descriptor is always the last entry.
template<typename Cmd>
class OptionTable {
public:
    OptionTable() { descriptors_.push_back(OptionDescriptor::Help()); }

    template<typename T>
    OptionTable& field(std::string name, T Cmd::* member, FieldSpec spec = {}) {
        for (const auto& d : descriptors_)
            if (d.name == name) throw std::runtime_error("Option '" + name + "' registered twice");

        OptionDescriptor d;
        if (!spec.short_alias.empty()) d.short_alias = "-" + spec.short_alias;
        d.long_alias = "--" + (spec.long_alias.empty() ? name : spec.long_alias);
        d.name = std::move(name);
        d.help = std::move(spec.help);
        d.required = spec.required.value_or(!detail::is_optional_v<T>);
        d.flag = spec.flag;
        d.type_hint = detail::TypeName<T>::get();
        d.autocomplete = std::move(spec.autocomplete);

        binders_.push_back([d, member](Cmd& obj, const ParsedTokens& tokens) {
            for (const auto& key : {d.longKey(), d.shortKey()}) {
                if (!key) continue;
                if (const auto value = tokens.option(*key)) {
                    detail::assignField(obj.*member, *key, *value, d);
                    return;
                }
            }
        });

        descriptors_.insert(descriptors_.end() - 1, std::move(d));
        return *this;
    }

    [[nodiscard]] const std::vector<OptionDescriptor>& descriptors() const { return descriptors_; }

    // Typed coercion of every supplied option. Throws ShellError(ParseError).
    void populate(Cmd& obj, const ParsedTokens& tokens) const {
        for (const auto& bind : binders_) bind(obj, tokens);
    }

private:
    std::vector<OptionDescriptor> descriptors_;
    std::vector<std::function<void(Cmd&, const ParsedTokens&)>> binders_;
};

// Commands whose options live in a static OptionTable:
//   static const OptionTable<Derived>& optionTable();
template<typename Derived>
class BoundCommand : public Command {
public:
    [[nodiscard]] const std::vector<OptionDescriptor>& options() const override {
        return Derived::optionTable().descriptors();
    }

    // Does not validate; the dispatcher runs validate() before execute()
    static Derived fromTokens(const ParsedTokens& tokens) {
        Derived cmd{};
        Derived::optionTable().populate(cmd, tokens);
        return cmd;
    }
};

}
