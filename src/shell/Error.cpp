#include "shell/Error.hpp"

#include <fmt/format.h>

using namespace hs::shell;

namespace {

// ["a", "b"]
std::string quotedList(const std::vector<std::string>& items) {
    std::string out = "[";
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += ", ";
        out += fmt::format("\"{}\"", items[i]);
    }
    out += "]";
    return out;
}

}

std::string_view hs::shell::to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::InvalidInput: return "InvalidInput";
    case ErrorKind::InvalidOption: return "InvalidOption";
    case ErrorKind::MissingOptions: return "MissingOptions";
    case ErrorKind::DuplicateOptions: return "DuplicateOptions";
    case ErrorKind::PopulatedFlagOptions: return "PopulatedFlagOptions";
    case ErrorKind::ParseError: return "ParseError";
    case ErrorKind::HttpError: return "HttpError";
    case ErrorKind::IoError: return "IoError";
    case ErrorKind::CommandNotFound: return "CommandNotFound";
    }
    return "Unknown";
}

ShellError::ShellError(const ErrorKind kind, const std::string& message, std::vector<std::string> items)
    : std::runtime_error(message), kind_(kind), items_(std::move(items)) {}

ShellError ShellError::invalidInput(const std::string& detail) {
    return {ErrorKind::InvalidInput, detail.empty() ? "Invalid input" : fmt::format("Invalid input: {}", detail)};
}

ShellError ShellError::invalidOption(const std::string& detail) {
    return {ErrorKind::InvalidOption, fmt::format("Invalid option: {}", detail)};
}

ShellError ShellError::missingOptions(std::vector<std::string> names) {
    auto msg = fmt::format("Missing required options: {}", quotedList(names));
    return {ErrorKind::MissingOptions, msg, std::move(names)};
}

ShellError ShellError::duplicateOptions(std::vector<std::string> names) {
    auto msg = fmt::format("Duplicate options: {}", quotedList(names));
    return {ErrorKind::DuplicateOptions, msg, std::move(names)};
}

ShellError ShellError::populatedFlagOptions(std::vector<std::string> aliases) {
    auto msg = fmt::format("Boolean flag options with value: {}", quotedList(aliases));
    return {ErrorKind::PopulatedFlagOptions, msg, std::move(aliases)};
}

ShellError ShellError::parseError(const std::string& key, const std::string& value, const std::string& expected) {
    return {ErrorKind::ParseError,
            fmt::format("Error parsing arguments: Option '{}' has value '{}' (expected type: {})", key, value, expected)};
}

ShellError ShellError::httpError(const std::string& detail) {
    return {ErrorKind::HttpError, fmt::format("HTTP Error: {}", detail)};
}

ShellError ShellError::ioError(const std::string& detail) {
    return {ErrorKind::IoError, fmt::format("IO error: {}", detail)};
}

ShellError ShellError::commandNotFound(const std::string& what) {
    return {ErrorKind::CommandNotFound, fmt::format("Command not found: {}", what)};
}
