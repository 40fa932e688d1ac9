#include "shell/autocomplete.hpp"

namespace hs::shell::autocomplete {

std::vector<std::string> boolValues(const CommandTree&, const std::string&, const std::vector<std::string>&) {
    return {"true", "false"};
}

AutocompleteFn oneOf(std::vector<std::string> values) {
    return [values = std::move(values)](const CommandTree&, const std::string& prefix, const std::vector<std::string>&) {
        std::vector<std::string> out;
        for (const auto& v : values)
            if (v.starts_with(prefix)) out.push_back(v);
        return out;
    };
}

}
