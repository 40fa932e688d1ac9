#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace hs::shell {

// POSIX-style word splitting: single quotes are literal, double quotes honor
// \$ \` \" \\ and line continuations, an unquoted backslash escapes the next char,
// and '#' at the start of a word comments out the rest of the line.
// Returns nullopt for an unterminated quote or a dangling backslash.
[[nodiscard]] std::optional<std::vector<std::string>> shellSplit(std::string_view line);

[[nodiscard]] bool needsQuotes(std::string_view token);

// Inverse of shellSplit for a single word
[[nodiscard]] std::string shellQuote(std::string_view token);
[[nodiscard]] std::string shellJoin(const std::vector<std::string>& tokens);

// "-1", "-2.5": values, not option keys
[[nodiscard]] bool looksNegativeNumber(std::string_view s);

inline bool isShellSpace(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

}
