#include "shell/OutputBuffer.hpp"
#include "logging/LogRegistry.hpp"

using namespace hs::shell;
using namespace hs::logging;

void OutputBuffer::appendLine(const std::string_view line) { lines_.emplace_back(line); }

void OutputBuffer::addWarning(const std::string& message) { warnings_.push_back(message); }

void OutputBuffer::addError(const std::string& message) { errors_.push_back(message); }

void OutputBuffer::setFilter(const std::string& pattern, const bool invert) {
    std::regex re(pattern);
    LogRegistry::shell()->debug("[OutputBuffer] Setting filter: pattern='{}', invert={}", pattern, invert);
    filter_ = Filter{pattern, std::move(re), invert};
}

void OutputBuffer::clearFilter() { filter_.reset(); }

std::vector<std::string> OutputBuffer::visibleLines() const {
    if (!filter_) return lines_;

    std::vector<std::string> out;
    for (const auto& line : lines_)
        if (std::regex_search(line, filter_->regex) != filter_->invert) out.push_back(line);
    return out;
}

void OutputBuffer::flush(std::ostream& os) {
    LogRegistry::shell()->debug("[OutputBuffer] Flushing {} lines", lines_.size());

    for (const auto& w : warnings_) os << "Warning: " << w << '\n';
    for (const auto& e : errors_) os << "Error: " << e << '\n';
    for (const auto& line : visibleLines()) os << line << '\n';
    os.flush();

    clear();
}

void OutputBuffer::clear() {
    lines_.clear();
    warnings_.clear();
    errors_.clear();
}
