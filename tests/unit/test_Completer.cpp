#include <gtest/gtest.h>
#include "shell/Completer.hpp"
#include "TestCommands.hpp"

#include <stdexcept>

using namespace hs::shell;
using namespace hs::test;

using Names = std::vector<std::string>;

namespace {

Names replacements(const CompletionResult& r) {
    Names out;
    for (const auto& c : r.candidates) out.push_back(c.replacement);
    return out;
}

// One value option whose lookup always fails
class Flaky final : public Command {
public:
    Flaky() {
        OptionDescriptor d;
        d.name = "target";
        d.short_alias = "-t";
        d.long_alias = "--target";
        d.type_hint = "string";
        d.autocomplete = [](const CommandTree&, const std::string&, const std::vector<std::string>&)
            -> std::vector<std::string> { throw std::runtime_error("backend unreachable"); };
        opts_ = {d, OptionDescriptor::Help()};
    }

    [[nodiscard]] std::string name() const override { return "flaky"; }
    [[nodiscard]] const std::vector<OptionDescriptor>& options() const override { return opts_; }
    void execute(const CommandContext&, const ParsedTokens&) const override {}

private:
    std::vector<OptionDescriptor> opts_;
};

}

class CompleterTest : public ::testing::Test {
protected:
    CommandTree tree;

    void SetUp() override {
        buildTestTree(tree);
        tree.addCommand("flaky", Flaky{});
    }

    [[nodiscard]] CompletionResult complete(const std::string& line, CompleterOptions opts = {}) const {
        return Completer(tree, opts).complete(line, line.size());
    }
};

TEST_F(CompleterTest, ScopePrefixAtRoot) {
    const auto r = complete("cla");
    EXPECT_EQ(r.start, 0u);
    ASSERT_EQ(r.candidates.size(), 1u);
    EXPECT_EQ(r.candidates[0], (Candidate{"class", "class"}));
}

TEST_F(CompleterTest, EverythingAtRootForEmptyLine) {
    EXPECT_EQ(replacements(complete("")), (Names{"flaky", "help", "class", "namespace"}));
}

TEST_F(CompleterTest, CommandsInsideScope) {
    const auto r = complete("class ");
    EXPECT_EQ(r.start, 6u);
    EXPECT_EQ(replacements(r), (Names{"create", "info"}));
    EXPECT_EQ(replacements(complete("class in")), Names{"info"});
}

TEST_F(CompleterTest, UnknownTokenKeepsDeepestScope) {
    EXPECT_EQ(replacements(complete("bogus cl")), Names{"class"});
    EXPECT_EQ(replacements(complete("class bogus cr")), Names{"create"});
}

TEST_F(CompleterTest, ValueSuggestionsFromAutocomplete) {
    const std::string line = "class info --name ac";
    const auto r = complete(line);
    EXPECT_EQ(r.start, line.size() - 2);
    EXPECT_EQ(replacements(r), (Names{"acme", "acme2"}));
    EXPECT_EQ(r.candidates[0].display, "acme");
}

TEST_F(CompleterTest, ShortAliasAlsoTriggersAutocomplete) {
    EXPECT_EQ(replacements(complete("class info -n ")), (Names{"acme", "acme2", "beta"}));
}

TEST_F(CompleterTest, UnterminatedQuoteYieldsNothing) {
    const std::string line = R"(class info --name "acme)";
    const auto r = complete(line);
    EXPECT_EQ(r.start, line.size());
    EXPECT_TRUE(r.candidates.empty());
}

TEST_F(CompleterTest, AllFlagsAfterCommand) {
    EXPECT_EQ(replacements(complete("class info ")), (Names{"--name", "--json", "--help"}));
}

TEST_F(CompleterTest, SeenOptionsAreNotOfferedAgain) {
    EXPECT_EQ(replacements(complete("class info --name acme ")), (Names{"--json", "--help"}));
    EXPECT_EQ(replacements(complete("class info -n acme -")), (Names{"--json", "--help"}));
    EXPECT_EQ(replacements(complete("class info --name=acme --")), (Names{"--json", "--help"}));
}

TEST_F(CompleterTest, DashPrefixFiltersByAlias) {
    EXPECT_EQ(replacements(complete("class info --j")), Names{"--json"});
    EXPECT_EQ(replacements(complete("class info -h")), Names{"--help"});
    EXPECT_TRUE(complete("class info --zzz").candidates.empty());
}

TEST_F(CompleterTest, FlagIsFollowedByMoreFlags) {
    EXPECT_EQ(replacements(complete("class info --json ")), (Names{"--name", "--help"}));
}

TEST_F(CompleterTest, CompleteValueMovesOnToFlags) {
    const std::string line = "class info --name acme";
    const auto r = complete(line);
    EXPECT_EQ(r.start, line.size());
    EXPECT_EQ(replacements(r), (Names{" --json", " --help"}));
}

TEST_F(CompleterTest, ValueOptionWithoutAutocompleteYieldsNothing) {
    EXPECT_TRUE(complete("class create --description ").candidates.empty());
}

TEST_F(CompleterTest, CallbacksCanBeDisabled) {
    EXPECT_TRUE(complete("class info --name ac", {.value_callbacks = false}).candidates.empty());
}

TEST_F(CompleterTest, FailingAutocompleteIsContained) {
    CompletionResult r;
    EXPECT_NO_THROW(r = complete("flaky --target x"));
    EXPECT_TRUE(r.candidates.empty());
}

TEST_F(CompleterTest, CursorInTheMiddle) {
    const std::string line = "class in --name acme";
    const auto r = Completer(tree).complete(line, 8);
    EXPECT_EQ(r.start, 6u);
    EXPECT_EQ(replacements(r), Names{"info"});
}

TEST_F(CompleterTest, CursorPastEndIsClamped) {
    EXPECT_EQ(replacements(Completer(tree).complete("cla", 99)), Names{"class"});
}

TEST_F(CompleterTest, FlagDisplayIsAligned) {
    const auto r = complete("class info ");
    ASSERT_EQ(r.candidates.size(), 3u);

    const auto& name = r.candidates[0].display;
    EXPECT_EQ(name.rfind("-n --name <string>", 0), 0u) << name;
    EXPECT_TRUE(name.ends_with("Name of the class")) << name;

    // help text starts in the same column for every row
    const auto col = name.find("Name of the class");
    EXPECT_EQ(r.candidates[1].display.find("Output as JSON"), col);
    EXPECT_EQ(r.candidates[2].display.find("Prints help information"), col);
}

TEST_F(CompleterTest, GluedValueCompletesInPlace) {
    const std::string line = "class info --name=ac";
    const auto r = complete(line);
    EXPECT_EQ(r.start, line.size() - 9);
    EXPECT_EQ(replacements(r), (Names{"--name=acme", "--name=acme2"}));
    EXPECT_EQ(r.candidates[0].display, "acme");

    EXPECT_TRUE(complete("class info --json=tr").candidates.empty());
    EXPECT_TRUE(complete("class create --description=x").candidates.empty());
}

TEST_F(CompleterTest, QuotedWordIsMatchedUnquoted) {
    const std::string line = "class info --name 'ac'";
    const auto r = complete(line);
    EXPECT_EQ(r.start, line.size() - 4);
    EXPECT_EQ(replacements(r), (Names{"acme", "acme2"}));

    EXPECT_EQ(replacements(complete(R"(class "in")")), Names{"info"});
}

TEST_F(CompleterTest, CommentWordYieldsNothing) {
    const std::string line = "class #x";
    const auto r = complete(line);
    EXPECT_EQ(r.start, line.size());
    EXPECT_TRUE(r.candidates.empty());
}

TEST_F(CompleterTest, EscapedSpaceStaysInOneWord) {
    EXPECT_TRUE(complete(R"(class info --name a\ b)").candidates.empty());
}
