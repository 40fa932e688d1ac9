#pragma once

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hs::shell {

enum class ErrorKind {
    InvalidInput,
    InvalidOption,
    MissingOptions,
    DuplicateOptions,
    PopulatedFlagOptions,
    ParseError,
    HttpError,
    IoError,
    CommandNotFound
};

std::string_view to_string(ErrorKind kind);

class ShellError : public std::runtime_error {
public:
    ShellError(ErrorKind kind, const std::string& message, std::vector<std::string> items = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    // Offending option names/aliases for the three validation kinds, empty otherwise
    [[nodiscard]] const std::vector<std::string>& items() const noexcept { return items_; }

    static ShellError invalidInput(const std::string& detail = {});
    static ShellError invalidOption(const std::string& detail);
    static ShellError missingOptions(std::vector<std::string> names);
    static ShellError duplicateOptions(std::vector<std::string> names);
    static ShellError populatedFlagOptions(std::vector<std::string> aliases);
    static ShellError parseError(const std::string& key, const std::string& value, const std::string& expected);
    static ShellError httpError(const std::string& detail);
    static ShellError ioError(const std::string& detail);
    static ShellError commandNotFound(const std::string& what);

private:
    ErrorKind kind_;
    std::vector<std::string> items_;
};

}
