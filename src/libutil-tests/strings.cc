#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "fetchcache/util/strings.hh"
#include "fetchcache/util/error.hh"

namespace fetchcache {

/* ----------------------------------------------------------------------------
 * concatStringsSep
 * --------------------------------------------------------------------------*/

TEST(concatStringsSep, empty)
{
    Strings strings;

    ASSERT_EQ(concatStringsSep(",", strings), "");
}

TEST(concatStringsSep, justOne)
{
    Strings strings;
    strings.push_back("this");

    ASSERT_EQ(concatStringsSep(",", strings), "this");
}

TEST(concatStringsSep, emptyStrings)
{
    Strings strings;
    strings.push_back("");
    strings.push_back("");

    ASSERT_EQ(concatStringsSep(",", strings), ",");
}

TEST(concatStringsSep, buildCommaSeparatedString)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep(",", strings), "this,is,great");
}

TEST(concatStringsSep, buildStringWithEmptySeparator)
{
    Strings strings;
    strings.push_back("this");
    strings.push_back("is");
    strings.push_back("great");

    ASSERT_EQ(concatStringsSep("", strings), "thisisgreat");
}

TEST(concatStringsSep, sortedSet)
{
    StringSet strings{"c", "a", "b"};

    ASSERT_EQ(concatStringsSep(", ", strings), "a, b, c");
}

/* ----------------------------------------------------------------------------
 * tokenizeString
 * --------------------------------------------------------------------------*/

TEST(tokenizeString, empty)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(""), expected);
}

TEST(tokenizeString, oneSep)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(" "), expected);
}

TEST(tokenizeString, twoSep)
{
    Strings expected = {};

    ASSERT_EQ(tokenizeString<Strings>(" \n"), expected);
}

TEST(tokenizeString, tokenizeSpacesWithDefaults)
{
    auto s = "foo bar baz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeTabsWithDefaults)
{
    auto s = "foo\tbar\tbaz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeSpacesWithSpacesAndTabsWithDefaults)
{
    auto s = "foo\t bar\t baz";
    Strings expected = {"foo", "bar", "baz"};

    ASSERT_EQ(tokenizeString<Strings>(s), expected);
}

TEST(tokenizeString, tokenizeWithCustomSep)
{
    auto s = "foo\n,bar\n,baz\n";
    Strings expected = {"foo\n", "bar\n", "baz\n"};

    ASSERT_EQ(tokenizeString<Strings>(s, ","), expected);
}

TEST(tokenizeString, tokenizeIntoSet)
{
    auto s = "b:a:b";
    StringSet expected = {"a", "b"};

    ASSERT_EQ(tokenizeString<StringSet>(s, ":"), expected);
}

/* ----------------------------------------------------------------------------
 * splitString
 * --------------------------------------------------------------------------*/

using SplittingTypes = ::testing::Types<std::list<std::string>, std::vector<std::string>>;

template<class C>
class splitStringTest : public ::testing::Test
{};

TYPED_TEST_SUITE(splitStringTest, SplittingTypes);

TYPED_TEST(splitStringTest, empty)
{
    TypeParam expected = {""};

    EXPECT_EQ(splitString<TypeParam>("", " \t\n\r"), expected);
}

TYPED_TEST(splitStringTest, oneSep)
{
    TypeParam expected = {"", ""};

    EXPECT_EQ(splitString<TypeParam>(" ", " \t\n\r"), expected);
}

TYPED_TEST(splitStringTest, tokenizeWithCustomSep)
{
    auto s = "foo\n,bar\n,baz\n";
    TypeParam expected = {"foo\n", "bar\n", "baz\n"};

    EXPECT_EQ(splitString<TypeParam>(s, ","), expected);
}

TYPED_TEST(splitStringTest, emptyStringsBetweenSeparators)
{
    auto s = "a,,b,";
    TypeParam expected = {"a", "", "b", ""};

    EXPECT_EQ(splitString<TypeParam>(s, ","), expected);
}

RC_GTEST_TYPED_FIXTURE_PROP(splitStringTest, recoveredByConcatStringsSep, (const std::string & s))
{
    RC_ASSERT(concatStringsSep("/", splitString<TypeParam>(s, "/")) == s);
    RC_ASSERT(concatStringsSep("a", splitString<TypeParam>(s, "a")) == s);
}

} // namespace fetchcache
