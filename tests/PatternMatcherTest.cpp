#include <gtest/gtest.h>

#include "features/PatternMatcher.h"
#include "core/Error.h"

using namespace BulkRename;

TEST(PatternMatcherTest, SearchFindsMatchAnywhere)
{
    PatternMatcher matcher(R"(a(\d)\.txt)");
    auto result = matcher.match("xa1.txt.bak", false);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->groupCount(), 1u);
    EXPECT_EQ(result->groups[0], std::optional<std::string>("1"));
    EXPECT_EQ(result->matchedText, "a1.txt");
    EXPECT_EQ(result->matchStart, 1u);
    EXPECT_EQ(result->matchEnd, 7u);
}

TEST(PatternMatcherTest, FullMatchRejectsSubstringMatch)
{
    PatternMatcher matcher(R"(a(\d)\.txt)");
    EXPECT_FALSE(matcher.match("xa1.txt", true).has_value());
    EXPECT_FALSE(matcher.match("a1.txt.bak", true).has_value());
    EXPECT_TRUE(matcher.match("a1.txt", true).has_value());
}

TEST(PatternMatcherTest, FullMatchAppliesToAlternation)
{
    // Anchoring must cover the whole alternation, not only its first branch
    PatternMatcher matcher("a|ab");
    EXPECT_TRUE(matcher.match("ab", true).has_value());
}

TEST(PatternMatcherTest, NoMatchReturnsNullopt)
{
    PatternMatcher matcher(R"(\d+)");
    EXPECT_FALSE(matcher.match("readme.md", false).has_value());
}

TEST(PatternMatcherTest, NonParticipatingGroupIsDistinctFromEmpty)
{
    PatternMatcher matcher(R"((x)?(y*)\.txt)");
    auto result = matcher.match(".txt", true);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->groupCount(), 2u);
    EXPECT_FALSE(result->groups[0].has_value());
    ASSERT_TRUE(result->groups[1].has_value());
    EXPECT_EQ(*result->groups[1], "");
}

TEST(PatternMatcherTest, TrailingUnsetGroupsAreReported)
{
    PatternMatcher matcher(R"((a)(b)?(c)?)");
    auto result = matcher.match("a", false);
    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(result->groupCount(), 3u);
    EXPECT_EQ(result->groups[0], std::optional<std::string>("a"));
    EXPECT_FALSE(result->groups[1].has_value());
    EXPECT_FALSE(result->groups[2].has_value());
}

TEST(PatternMatcherTest, NamedGroupsAreIndexed)
{
    PatternMatcher matcher(R"((?<name>\w+)-(?<num>\d+))");
    EXPECT_EQ(matcher.groupCount(), 2u);
    const auto& named = matcher.namedGroups();
    ASSERT_EQ(named.size(), 2u);
    EXPECT_EQ(named.at("name"), 1u);
    EXPECT_EQ(named.at("num"), 2u);

    auto result = matcher.match("file-12", true);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->namedGroups.at("num"), 2u);
}

TEST(PatternMatcherTest, UnicodeDigitsAndWords)
{
    PatternMatcher matcher(R"((\w+)_(\d+))");
    auto result = matcher.match("caf\xC3\xA9_\xD9\xA3", true);  // "café_٣"
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result->groups[0], "caf\xC3\xA9");
    EXPECT_EQ(*result->groups[1], "\xD9\xA3");
}

TEST(PatternMatcherTest, InvalidPatternThrows)
{
    try {
        PatternMatcher matcher("(unclosed");
        FAIL() << "Expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.code(), ErrorCode::RENAME_INVALID_PATTERN);
        EXPECT_NE(e.error().details().find("(unclosed"), std::string::npos);
    }
}

TEST(PatternMatcherTest, InvalidUtf8SubjectDoesNotMatch)
{
    PatternMatcher matcher(".*");
    EXPECT_FALSE(matcher.match("bad\xFFname", false).has_value());
}

TEST(PatternMatcherTest, MovedMatcherStillWorks)
{
    PatternMatcher source(R"((\d+))");
    PatternMatcher moved(std::move(source));
    auto result = moved.match("abc42", false);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result->groups[0], "42");
    EXPECT_EQ(moved.pattern(), R"((\d+))");
}

TEST(PatternMatcherTest, MatchLimitIsAnErrorNotAMiss)
{
    PatternMatcher matcher("(*LIMIT_MATCH=1000)(a|aa)+c");
    const std::string subject = "c" + std::string(30, 'a');
    try {
        matcher.match(subject, false);
        FAIL() << "Expected ErrorException";
    } catch (const ErrorException& e) {
        EXPECT_EQ(e.code(), ErrorCode::RENAME_MATCH_FAILED);
        EXPECT_NE(e.error().details().find(subject), std::string::npos);
    }
}
