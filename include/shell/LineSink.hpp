#pragma once

#include <string_view>

namespace hs::shell {

// Append-only line destination for help text and tree rendering
class LineSink {
public:
    virtual ~LineSink() = default;
    virtual void appendLine(std::string_view line) = 0;
};

}
