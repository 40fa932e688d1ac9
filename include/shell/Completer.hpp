#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace hs::shell {

class Command;
class CommandTree;
struct OptionDescriptor;

struct Candidate {
    std::string display;        // what the user sees in the list
    std::string replacement;    // what replaces the current word

    bool operator==(const Candidate&) const = default;
};

struct CompletionResult {
    std::size_t start = 0;      // byte offset the replacement starts at
    std::vector<Candidate> candidates;
};

struct CompleterOptions {
    bool value_callbacks = true;    // false: per-option autocomplete functions are never called
};

// Read-only walk of the tree for the line under the cursor. Never throws;
// every failure narrows the candidate list, down to empty.
class Completer {
public:
    explicit Completer(const CommandTree& tree, CompleterOptions opts = {});

    [[nodiscard]] CompletionResult complete(const std::string& line, std::size_t cursor) const;

private:
    const CommandTree& tree_;
    CompleterOptions opts_;

    [[nodiscard]] CompletionResult completeUnchecked(const std::string& line, std::size_t cursor) const;

    [[nodiscard]] static std::vector<Candidate> optionCandidates(const Command& cmd,
                                                                 const std::vector<const OptionDescriptor*>& seen,
                                                                 const std::string& word);
};

}
