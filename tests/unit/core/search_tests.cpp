#include <gtest/gtest.h>

#include "markdd/core/search.hpp"

#include <string>

using markdd::core::InvalidSearchPattern;
using markdd::core::SearchOptions;
using markdd::core::SearchPattern;
using markdd::core::SelectionRange;

TEST(Search, PlainQueriesAreLiteral)
{
    SearchPattern pattern("a.b", SearchOptions{});
    auto matches = pattern.findAll("axb a.b");
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0], (SelectionRange{4, 7}));
}

TEST(Search, CaseSensitivityIsOptional)
{
    EXPECT_EQ(SearchPattern("word", SearchOptions{}).findAll("Word WORD word").size(), 3u);

    SearchOptions exact;
    exact.caseSensitive = true;
    EXPECT_EQ(SearchPattern("word", exact).findAll("Word WORD word").size(), 1u);
}

TEST(Search, WholeWordRequiresBoundaries)
{
    SearchOptions options;
    options.wholeWord = true;
    auto matches = SearchPattern("cat", options).findAll("cat concatenate cat.");
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[1].start, 16u);
}

TEST(Search, RegexQueriesAndInvalidPatterns)
{
    SearchOptions options;
    options.regex = true;
    EXPECT_EQ(SearchPattern("[0-9]+", options).findAll("a1 b22 c333").size(), 3u);
    EXPECT_THROW(SearchPattern("(unclosed", options), InvalidSearchPattern);
    EXPECT_NO_THROW(SearchPattern("(unclosed", SearchOptions{}));
}

TEST(Search, EmptyQueryMatchesNothing)
{
    SearchPattern pattern("", SearchOptions{});
    EXPECT_TRUE(pattern.empty());
    EXPECT_TRUE(pattern.findAll("anything").empty());
    EXPECT_FALSE(pattern.findNext("anything", 0).has_value());
}

TEST(Search, NextAndPreviousWrapAround)
{
    SearchPattern pattern("x", SearchOptions{});
    const std::string content = "x-x-x";
    EXPECT_EQ(pattern.findNext(content, 1)->start, 2u);
    EXPECT_EQ(pattern.findNext(content, 5)->start, 0u);
    EXPECT_FALSE(pattern.findNext(content, 5, false).has_value());
    EXPECT_EQ(pattern.findPrevious(content, 2)->start, 0u);
    EXPECT_EQ(pattern.findPrevious(content, 0)->start, 4u);
}

TEST(Search, RegexReplacementExpandsGroups)
{
    SearchOptions options;
    options.regex = true;
    SearchPattern pattern("(\\w+)@(\\w+)", options);
    std::size_t count = 0;
    EXPECT_EQ(pattern.replaceAll("me@home you@work", "$2:$1", count), "home:me work:you");
    EXPECT_EQ(count, 2u);
}

TEST(Search, PlainReplacementIsVerbatim)
{
    SearchPattern pattern("cost", SearchOptions{});
    std::size_t count = 0;
    EXPECT_EQ(pattern.replaceAll("cost", "$1", count), "$1");
    EXPECT_EQ(count, 1u);
}
