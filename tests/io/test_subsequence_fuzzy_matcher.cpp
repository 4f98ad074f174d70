#include "beadview/io/subsequence_fuzzy_matcher.hpp"
#include <gtest/gtest.h>

namespace beadview {

class SubsequenceFuzzyMatcherTest : public ::testing::Test {
protected:
    SubsequenceFuzzyMatcher matcher_;
};

TEST_F(SubsequenceFuzzyMatcherTest, MatchesSubsequenceIgnoringCase)
{
    EXPECT_TRUE(SubsequenceFuzzyMatcher::score("bknd", "Backend").has_value());
    EXPECT_TRUE(SubsequenceFuzzyMatcher::score("API", "public api").has_value());
    EXPECT_FALSE(SubsequenceFuzzyMatcher::score("xyz", "backend").has_value());
    EXPECT_FALSE(SubsequenceFuzzyMatcher::score("dneb", "backend").has_value());
}

TEST_F(SubsequenceFuzzyMatcherTest, EmptyQueryMatchesEverything)
{
    auto matches = matcher_.find("", {"a", "b"});

    ASSERT_EQ(matches.size(), 2);
    EXPECT_EQ(matches[0].index, 0);
    EXPECT_EQ(matches[1].index, 1);
}

TEST_F(SubsequenceFuzzyMatcherTest, PrefixAndConsecutiveMatchesRankFirst)
{
    std::vector<std::string> candidates{"the api layer", "a-p-i", "api", "xapi"};

    auto matches = matcher_.find("api", candidates);

    ASSERT_EQ(matches.size(), 4);
    EXPECT_EQ(candidates[matches[0].index], "api");
    EXPECT_GT(matches[0].score, matches[1].score);
}

TEST_F(SubsequenceFuzzyMatcherTest, WordBoundaryBeatsMidWord)
{
    auto boundary = SubsequenceFuzzyMatcher::score("p", "tree parser");
    auto mid_word = SubsequenceFuzzyMatcher::score("p", "treepwalk");

    ASSERT_TRUE(boundary && mid_word);
    EXPECT_GT(*boundary, *mid_word);
}

TEST_F(SubsequenceFuzzyMatcherTest, NonMatchesAreDropped)
{
    auto matches = matcher_.find("ui", {"backend", "frontend ui", "build"});

    ASSERT_EQ(matches.size(), 2);
    EXPECT_EQ(matches[0].index, 1);
    EXPECT_EQ(matches[1].index, 2);
}

} // namespace beadview
