#include "shell/Lexer.hpp"

#include <algorithm>

namespace hs::shell {

namespace {

void skipSpace(const char*& p, const char* e) {
    while (p < e && isShellSpace(*p)) ++p;
}

void skipComment(const char*& p, const char* e) {
    while (p < e && *p != '\n') ++p;
}

// p is at the opening quote
bool readSingleQuoted(const char*& p, const char* e, std::string& buf) {
    ++p;
    while (p < e && *p != '\'') buf.push_back(*p++);
    if (p == e) return false;
    ++p;
    return true;
}

bool readDoubleQuoted(const char*& p, const char* e, std::string& buf) {
    ++p;
    while (p < e) {
        if (*p == '"') { ++p; return true; }
        if (*p == '\\') {
            if (p + 1 == e) return false;
            const char next = p[1];
            if (next == '$' || next == '`' || next == '"' || next == '\\') {
                buf.push_back(next);
                p += 2;
            } else if (next == '\n') {
                p += 2;
            } else {
                buf.push_back(*p++);
            }
            continue;
        }
        buf.push_back(*p++);
    }
    return false;
}

}

std::optional<std::vector<std::string>> shellSplit(const std::string_view line) {
    std::vector<std::string> out;
    const char* p = line.data();
    const char* e = p + line.size();

    for (;;) {
        skipSpace(p, e);
        if (p == e) break;

        if (*p == '#') {
            skipComment(p, e);
            continue;
        }

        std::string word;
        while (p < e && !isShellSpace(*p)) {
            if (*p == '\'') {
                if (!readSingleQuoted(p, e, word)) return std::nullopt;
            } else if (*p == '"') {
                if (!readDoubleQuoted(p, e, word)) return std::nullopt;
            } else if (*p == '\\') {
                if (p + 1 == e) return std::nullopt;
                if (p[1] != '\n') word.push_back(p[1]);
                p += 2;
            } else {
                word.push_back(*p++);
            }
        }
        out.push_back(std::move(word));
    }

    return out;
}

bool needsQuotes(const std::string_view token) {
    if (token.empty() || token.front() == '#') return true;
    return std::ranges::any_of(token, [](const char c) {
        return isShellSpace(c) || c == '"' || c == '\'' || c == '\\';
    });
}

std::string shellQuote(const std::string_view token) {
    if (!needsQuotes(token)) return std::string(token);
    std::string out;
    out.reserve(token.size() + 2);
    out.push_back('"');
    for (const char c : token) {
        if (c == '"' || c == '\\' || c == '$' || c == '`') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

std::string shellJoin(const std::vector<std::string>& tokens) {
    std::string line;
    for (const auto& t : tokens) {
        if (!line.empty()) line.push_back(' ');
        line += shellQuote(t);
    }
    return line;
}

bool looksNegativeNumber(const std::string_view s) {
    if (s.size() < 2 || s[0] != '-') return false;
    bool dot = false, digit = false;
    for (size_t i = 1; i < s.size(); ++i) {
        const char c = s[i];
        if (c >= '0' && c <= '9') { digit = true; continue; }
        if (c == '.' && !dot) { dot = true; continue; }
        return false;
    }
    return digit;
}

}
