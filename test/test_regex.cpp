#include "test.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string_view>

using fsm_regex::input_required;
using fsm_regex::invalid_input;
using fsm_regex::invalid_pattern;

TEST(Regex, LiteralsAndWildcard)
{
    auto re = test_compile("a.c");
    EXPECT_TRUE(re.match("abc"));
    EXPECT_TRUE(re.match("axc"));
    EXPECT_TRUE(re.match("a.c"));
    EXPECT_FALSE(re.match("ac"));
    EXPECT_FALSE(re.match("abcd"));
    EXPECT_FALSE(re.match("xbc"));
    EXPECT_FALSE(re.match(""));
}

TEST(Regex, LiteralOnly)
{
    auto re = test_compile("hello");
    EXPECT_TRUE(re.match("hello"));
    EXPECT_FALSE(re.match("hell"));
    EXPECT_FALSE(re.match("hello!"));
    EXPECT_FALSE(re.match("Hello"));
}

TEST(Regex, InvalidPatterns)
{
    EXPECT_THROW(fsm_regex::compile(""), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("*abc"), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("+x"), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("*"), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("[abc"), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("ab["), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("a\xff"), invalid_pattern);
    EXPECT_THROW(fsm_regex::compile("[z-a"), invalid_pattern);
}

TEST(Regex, ReversedClassRange)
{
    auto re = test_compile("[z-a]");
    EXPECT_FALSE(re.match("m"));
    EXPECT_FALSE(re.match("a"));
    EXPECT_FALSE(re.match("z"));

    auto negated = test_compile("[^z-a]");
    EXPECT_TRUE(negated.match("m"));
    EXPECT_TRUE(negated.match("a"));

    auto mixed = test_compile("[z-a0-9]+");
    EXPECT_TRUE(mixed.match("42"));
    EXPECT_FALSE(mixed.match("4m"));
}

TEST(Regex, MalformedUtf8InClass)
{
    try {
        fsm_regex::compile("[a\xff" "b]");
        FAIL() << "expected invalid_pattern";
    } catch (invalid_pattern const& e) {
        EXPECT_THAT(e.what(), testing::HasSubstr("not valid UTF-8"));
        EXPECT_THAT(e.what(), testing::Not(testing::HasSubstr("unclosed")));
    }
}

TEST(Regex, InvalidPatternIsRegexError)
{
    try {
        fsm_regex::compile("[abc");
        FAIL() << "expected invalid_pattern";
    } catch (fsm_regex::regex_error const& e) {
        EXPECT_THAT(e.what(), testing::HasSubstr("unclosed character class"));
    }
}

TEST(Regex, Star)
{
    auto re = test_compile("a*");
    EXPECT_TRUE(re.match(""));
    EXPECT_TRUE(re.match("a"));
    EXPECT_TRUE(re.match("aaaa"));
    EXPECT_FALSE(re.match("b"));
    EXPECT_FALSE(re.match("aab"));
}

TEST(Regex, Plus)
{
    auto re = test_compile("a+");
    EXPECT_FALSE(re.match(""));
    EXPECT_TRUE(re.match("a"));
    EXPECT_TRUE(re.match("aaa"));
    EXPECT_FALSE(re.match("aaab"));
}

TEST(Regex, StarInTheMiddle)
{
    auto re = test_compile("a*b");
    EXPECT_TRUE(re.match("b"));
    EXPECT_TRUE(re.match("ab"));
    EXPECT_TRUE(re.match("aaab"));
    EXPECT_FALSE(re.match("a"));
    EXPECT_FALSE(re.match("aba"));
}

TEST(Regex, ConsecutiveStars)
{
    auto re = test_compile("ab*c*d");
    EXPECT_TRUE(re.match("ad"));
    EXPECT_TRUE(re.match("abd"));
    EXPECT_TRUE(re.match("acd"));
    EXPECT_TRUE(re.match("abbccd"));
    EXPECT_FALSE(re.match("acbd"));
    EXPECT_FALSE(re.match("a"));
}

TEST(Regex, PlusFollowedByStar)
{
    auto re = test_compile("x+y*");
    EXPECT_TRUE(re.match("x"));
    EXPECT_TRUE(re.match("xxx"));
    EXPECT_TRUE(re.match("xyy"));
    EXPECT_FALSE(re.match("y"));
    EXPECT_FALSE(re.match(""));
}

TEST(Regex, WildcardStar)
{
    auto re = test_compile("a.*b");
    EXPECT_TRUE(re.match("ab"));
    EXPECT_TRUE(re.match("axxb"));
    EXPECT_TRUE(re.match("abbb"));
    EXPECT_FALSE(re.match("axx"));

    auto any = test_compile(".*");
    EXPECT_TRUE(any.match(""));
    EXPECT_TRUE(any.match("anything at all"));
}

TEST(Regex, RepeatedQuantifier)
{
    auto re = test_compile("a**");
    EXPECT_TRUE(re.match(""));
    EXPECT_TRUE(re.match("aaa"));
    EXPECT_FALSE(re.match("ab"));
}

TEST(Regex, CharacterClass)
{
    auto re = test_compile("[a-z0-9]+");
    EXPECT_TRUE(re.match("abc123"));
    EXPECT_FALSE(re.match("ABC"));
    EXPECT_FALSE(re.match(""));
    EXPECT_FALSE(re.match("abc-123"));
}

TEST(Regex, NegatedCharacterClass)
{
    auto re = test_compile("[^0-9]");
    EXPECT_FALSE(re.match("5"));
    EXPECT_TRUE(re.match("x"));
    EXPECT_FALSE(re.match("xy"));
    EXPECT_FALSE(re.match(""));
}

TEST(Regex, ClassDanglingDash)
{
    auto re = test_compile("[a-c-e]");
    EXPECT_TRUE(re.match("b"));
    EXPECT_TRUE(re.match("-"));
    EXPECT_TRUE(re.match("e"));
    EXPECT_FALSE(re.match("d"));

    auto trailing = test_compile("[a-]");
    EXPECT_TRUE(trailing.match("a"));
    EXPECT_TRUE(trailing.match("-"));
    EXPECT_FALSE(trailing.match("b"));
}

TEST(Regex, EmptyClass)
{
    auto nothing = test_compile("[]a");
    EXPECT_FALSE(nothing.match("a"));
    EXPECT_FALSE(nothing.match("]a"));

    auto everything = test_compile("[^]");
    EXPECT_TRUE(everything.match("z"));
    EXPECT_TRUE(everything.match("]"));
}

TEST(Regex, MetaCharactersOutsideClassAreLiterals)
{
    auto re = test_compile("^a]$");
    EXPECT_TRUE(re.match("^a]$"));
    EXPECT_FALSE(re.match("a"));
}

TEST(Regex, ClassMayContainOpeningBracket)
{
    auto re = test_compile("[[.]x");
    EXPECT_TRUE(re.match("[x"));
    EXPECT_TRUE(re.match(".x"));
    EXPECT_FALSE(re.match("ax"));
}

TEST(Regex, CodePoints)
{
    auto re = test_compile("caf.");
    EXPECT_TRUE(re.match("café"));
    EXPECT_FALSE(re.match("cafés"));

    auto greek = test_compile("[α-ω]+");
    EXPECT_TRUE(greek.match("λμ"));
    EXPECT_FALSE(greek.match("abc"));

    auto hanja = test_compile("一+");
    EXPECT_TRUE(hanja.match("一一"));
}

TEST(Regex, InvalidInput)
{
    auto re = test_compile(".*");
    EXPECT_THROW(re.match("\xc3"), invalid_input);
}

TEST(Regex, InputRequired)
{
    for (auto pattern : {"a", "a*", "[^0-9]", ".+"}) {
        auto re = fsm_regex::compile(pattern);
        EXPECT_THROW(re.match(std::nullopt), input_required);
        EXPECT_THROW(re.match(static_cast<char const*>(nullptr)), input_required);
    }
}

TEST(Regex, EmptyStringIsAValidInput)
{
    auto re = fsm_regex::compile("b*");
    EXPECT_TRUE(re.match(std::optional<std::string_view>{""}));
    EXPECT_TRUE(re.match(std::string{}));
}

TEST(Regex, CompileIsDeterministic)
{
    auto inputs = {"", "a", "ab", "abc", "aabbc", "b", "bc", "xyz", "a1", "abcabc"};
    for (auto pattern : {"a*b*c", "[a-c]+", ".b*", "a+.*"}) {
        auto first = fsm_regex::compile(pattern);
        auto second = fsm_regex::compile(pattern);
        for (auto input : inputs) {
            EXPECT_EQ(first.match(input), second.match(input))
                << "pattern=" << pattern << " input=" << input;
        }
    }
}

TEST(Regex, PatternIsReusable)
{
    auto re = fsm_regex::compile("[0-9]+.[0-9]*", true);
    EXPECT_EQ(re.pattern(), "[0-9]+.[0-9]*");
    EXPECT_TRUE(re.match("3.14"));
    EXPECT_TRUE(re.match("10."));
    EXPECT_FALSE(re.match(".5"));
    EXPECT_TRUE(re.match("3.14"));
}
