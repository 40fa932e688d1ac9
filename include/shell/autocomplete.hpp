#pragma once

#include "shell/Option.hpp"

#include <string>
#include <vector>

namespace hs::shell::autocomplete {

// "true", "false"
std::vector<std::string> boolValues(const CommandTree& tree,
                                    const std::string& prefix,
                                    const std::vector<std::string>& tokens);

// Fixed value list, filtered by prefix
AutocompleteFn oneOf(std::vector<std::string> values);

}
