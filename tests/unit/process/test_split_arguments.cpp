/**
 * @file test_split_arguments.cpp
 * @brief Unit tests for argument string splitting
 */

#include <gtest/gtest.h>

#include <kcenon/transfer_adapter/process/child_process.h>

#include <string>
#include <vector>

namespace kcenon::transfer_adapter::test {

using words = std::vector<std::string>;

TEST(SplitArgumentsTest, EmptyString) {
    EXPECT_TRUE(split_arguments("").empty());
    EXPECT_TRUE(split_arguments("   \t ").empty());
}

TEST(SplitArgumentsTest, SplitsOnWhitespace) {
    EXPECT_EQ(split_arguments("--verbose  --store /tmp\t-x"),
              (words{"--verbose", "--store", "/tmp", "-x"}));
}

TEST(SplitArgumentsTest, DoubleQuotesKeepSpaces) {
    EXPECT_EQ(split_arguments(R"(--store "/tmp/lfs objects" -v)"),
              (words{"--store", "/tmp/lfs objects", "-v"}));
}

TEST(SplitArgumentsTest, SingleQuotesAreLiteral) {
    EXPECT_EQ(split_arguments(R"('a \"b\" c' d)"), (words{R"(a \"b\" c)", "d"}));
}

TEST(SplitArgumentsTest, EscapesInsideDoubleQuotes) {
    EXPECT_EQ(split_arguments(R"("say \"hi\"" "back\\slash")"),
              (words{R"(say "hi")", R"(back\slash)"}));
}

TEST(SplitArgumentsTest, BackslashOutsideQuotes) {
    EXPECT_EQ(split_arguments(R"(one\ word two)"), (words{"one word", "two"}));
}

TEST(SplitArgumentsTest, EmptyQuotedWordIsKept) {
    EXPECT_EQ(split_arguments(R"(--name "" x)"), (words{"--name", "", "x"}));
}

TEST(SplitArgumentsTest, AdjacentQuotedPartsJoin) {
    EXPECT_EQ(split_arguments(R"(pre"mid dle"'post')"), (words{"premid dlepost"}));
}

}  // namespace kcenon::transfer_adapter::test
