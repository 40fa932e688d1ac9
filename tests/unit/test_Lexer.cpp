#include <gtest/gtest.h>
#include "shell/Lexer.hpp"

using namespace hs::shell;

using Tokens = std::vector<std::string>;

TEST(LexerTest, SplitsOnWhitespace) {
    EXPECT_EQ(shellSplit("class  info\t--name acme"), (Tokens{"class", "info", "--name", "acme"}));
    EXPECT_EQ(shellSplit("   "), Tokens{});
}

TEST(LexerTest, SingleQuotesAreLiteral) {
    EXPECT_EQ(shellSplit(R"(echo 'a "b" \c')"), (Tokens{"echo", R"(a "b" \c)"}));
}

TEST(LexerTest, DoubleQuotesHonorEscapes) {
    EXPECT_EQ(shellSplit(R"(x "a \"b\" \\ \$HOME \n")"), (Tokens{"x", R"(a "b" \ $HOME \n)"}));
}

TEST(LexerTest, QuotedPartsJoinAdjacentText) {
    EXPECT_EQ(shellSplit(R"(--name=a"b c"'d')"), (Tokens{"--name=ab cd"}));
}

TEST(LexerTest, UnquotedBackslashEscapesNextChar) {
    EXPECT_EQ(shellSplit(R"(a\ b c\"d)"), (Tokens{"a b", "c\"d"}));
    EXPECT_EQ(shellSplit("a\\\nb"), (Tokens{"ab"}));
}

TEST(LexerTest, EmptyQuotesYieldEmptyWord) {
    EXPECT_EQ(shellSplit(R"(--name "")"), (Tokens{"--name", ""}));
    EXPECT_EQ(shellSplit("''"), (Tokens{""}));
}

TEST(LexerTest, HashStartsCommentOnlyAtWordStart) {
    EXPECT_EQ(shellSplit("a #comment here\nb"), (Tokens{"a", "b"}));
    EXPECT_EQ(shellSplit("a#b"), (Tokens{"a#b"}));
}

TEST(LexerTest, UnterminatedInputFails) {
    EXPECT_FALSE(shellSplit(R"(class info --name "acme)").has_value());
    EXPECT_FALSE(shellSplit("'open").has_value());
    EXPECT_FALSE(shellSplit("trailing\\").has_value());
}

TEST(LexerTest, QuoteOnlyWhenNeeded) {
    EXPECT_EQ(shellQuote("plain"), "plain");
    EXPECT_EQ(shellQuote(""), "\"\"");
    EXPECT_EQ(shellQuote("a b"), "\"a b\"");
    EXPECT_EQ(shellQuote(R"(say "hi")"), R"("say \"hi\"")");
    EXPECT_EQ(shellQuote("#tag"), "\"#tag\"");
}

TEST(LexerTest, JoinThenSplitRoundTrips) {
    const std::vector<Tokens> cases = {
        {"class", "info", "--name", "acme"},
        {"object", "create", "--data", R"({"a": [1, 2]})"},
        {"x", "", "two words", "tab\there"},
        {"quote's", R"(back\slash)", "$dollar", "`tick`"},
        {"#not-a-comment", "-5", "--"},
    };

    for (const auto& tokens : cases) {
        const auto line = shellJoin(tokens);
        const auto back = shellSplit(line);
        ASSERT_TRUE(back.has_value()) << line;
        EXPECT_EQ(*back, tokens) << line;
    }
}

TEST(LexerTest, NegativeNumbers) {
    EXPECT_TRUE(looksNegativeNumber("-1"));
    EXPECT_TRUE(looksNegativeNumber("-2.5"));
    EXPECT_FALSE(looksNegativeNumber("-"));
    EXPECT_FALSE(looksNegativeNumber("-n"));
    EXPECT_FALSE(looksNegativeNumber("--1"));
    EXPECT_FALSE(looksNegativeNumber("-1.2.3"));
    EXPECT_FALSE(looksNegativeNumber("5"));
}
