#pragma once

#include "shell/LineSink.hpp"

#include <optional>
#include <ostream>
#include <regex>
#include <string>
#include <vector>

namespace hs::shell {

class OutputBuffer final : public LineSink {
public:
    void appendLine(std::string_view line) override;

    // Warnings and errors are always shown, ahead of the lines and never filtered
    void addWarning(const std::string& message);
    void addError(const std::string& message);

    // Throws std::regex_error for an invalid pattern
    void setFilter(const std::string& pattern, bool invert = false);
    void clearFilter();
    [[nodiscard]] bool hasFilter() const { return filter_.has_value(); }

    // Lines that would be printed by flush(), filter applied
    [[nodiscard]] std::vector<std::string> visibleLines() const;
    [[nodiscard]] const std::vector<std::string>& lines() const { return lines_; }

    // Writes and clears everything except the filter
    void flush(std::ostream& os);
    void clear();

private:
    struct Filter {
        std::string pattern;
        std::regex regex;
        bool invert;
    };

    std::vector<std::string> lines_;
    std::vector<std::string> warnings_;
    std::vector<std::string> errors_;
    std::optional<Filter> filter_;
};

}
