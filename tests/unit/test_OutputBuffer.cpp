#include <gtest/gtest.h>
#include "shell/OutputBuffer.hpp"

#include <sstream>

using namespace hs::shell;

class OutputBufferTest : public ::testing::Test {
protected:
    OutputBuffer buffer;

    void SetUp() override {
        buffer.appendLine("acme     infra");
        buffer.appendLine("beta     default");
        buffer.appendLine("acme2    default");
    }
};

TEST_F(OutputBufferTest, FlushWritesWarningsErrorsThenLines) {
    buffer.addError("boom");
    buffer.addWarning("careful");

    std::ostringstream os;
    buffer.flush(os);
    EXPECT_EQ(os.str(),
              "Warning: careful\n"
              "Error: boom\n"
              "acme     infra\n"
              "beta     default\n"
              "acme2    default\n");
}

TEST_F(OutputBufferTest, FlushClearsContent) {
    std::ostringstream first;
    buffer.flush(first);

    std::ostringstream second;
    buffer.flush(second);
    EXPECT_TRUE(second.str().empty());
    EXPECT_TRUE(buffer.lines().empty());
}

TEST_F(OutputBufferTest, RegexFilter) {
    buffer.setFilter("^acme");
    EXPECT_EQ(buffer.visibleLines(), (std::vector<std::string>{"acme     infra", "acme2    default"}));
}

TEST_F(OutputBufferTest, InvertedFilter) {
    buffer.setFilter("default$", true);
    EXPECT_EQ(buffer.visibleLines(), std::vector<std::string>{"acme     infra"});
}

TEST_F(OutputBufferTest, FilterDoesNotHideErrors) {
    buffer.setFilter("nothing-matches");
    buffer.addError("still shown");

    std::ostringstream os;
    buffer.flush(os);
    EXPECT_EQ(os.str(), "Error: still shown\n");
}

TEST_F(OutputBufferTest, FilterSurvivesFlushUntilCleared) {
    buffer.setFilter("beta");
    std::ostringstream os;
    buffer.flush(os);
    EXPECT_TRUE(buffer.hasFilter());

    buffer.clearFilter();
    EXPECT_FALSE(buffer.hasFilter());
}

TEST_F(OutputBufferTest, InvalidPatternThrows) {
    EXPECT_THROW(buffer.setFilter("(unclosed"), std::regex_error);
    EXPECT_FALSE(buffer.hasFilter());
}
