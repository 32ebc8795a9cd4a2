#include "fetchcache/util/util.hh"
#include "fetchcache/util/types.hh"

#include <limits.h>
#include <gtest/gtest.h>

namespace fetchcache {

/* ----------------------------------------------------------------------------
 * hasPrefix
 * --------------------------------------------------------------------------*/

TEST(hasPrefix, emptyStringHasNoPrefix)
{
    ASSERT_FALSE(hasPrefix("", "foo"));
}

TEST(hasPrefix, emptyStringIsAlwaysPrefix)
{
    ASSERT_TRUE(hasPrefix("foo", ""));
    ASSERT_TRUE(hasPrefix("jshjkfhsadf", ""));
}

TEST(hasPrefix, trivialCase)
{
    ASSERT_TRUE(hasPrefix("foobar", "foo"));
}

/* ----------------------------------------------------------------------------
 * hasSuffix
 * --------------------------------------------------------------------------*/

TEST(hasSuffix, emptyStringHasNoSuffix)
{
    ASSERT_FALSE(hasSuffix("", "foo"));
}

TEST(hasSuffix, trivialCase)
{
    ASSERT_TRUE(hasSuffix("foo", "o"));
    ASSERT_TRUE(hasSuffix("foobar", "bar"));
}

/* ----------------------------------------------------------------------------
 * toLower
 * --------------------------------------------------------------------------*/

TEST(toLower, emptyString)
{
    ASSERT_EQ(toLower(""), "");
}

TEST(toLower, nonLetters)
{
    auto s = "!@(*$#)(@#=\\234_";
    ASSERT_EQ(toLower(s), s);
}

TEST(toLower, highBytesUnchanged)
{
    std::string s = "Caf\xc3\x89 \xe9\xff";
    ASSERT_EQ(toLower(s), "caf\xc3\x89 \xe9\xff");
}

TEST(toLower, mixedCase)
{
    ASSERT_EQ(toLower("Content-Type"), "content-type");
}

/* ----------------------------------------------------------------------------
 * trim, chomp
 * --------------------------------------------------------------------------*/

TEST(trim, emptyString)
{
    ASSERT_EQ(trim(""), "");
}

TEST(trim, onlyWhitespace)
{
    ASSERT_EQ(trim(" \t\r\n"), "");
}

TEST(trim, bothEnds)
{
    ASSERT_EQ(trim("  d41d8cd9\n"), "d41d8cd9");
}

TEST(trim, customWhitespace)
{
    ASSERT_EQ(trim("\"quoted\"", "\""), "quoted");
}

TEST(chomp, keepsLeadingWhitespace)
{
    ASSERT_EQ(chomp("  foo \n"), "  foo");
}

/* ----------------------------------------------------------------------------
 * string2Int
 * --------------------------------------------------------------------------*/

TEST(string2Int, validNumbers)
{
    ASSERT_EQ(string2Int<int>("42"), 42);
    ASSERT_EQ(string2Int<int>("-7"), -7);
    ASSERT_EQ(string2Int<unsigned long>("65536"), 65536u);
}

TEST(string2Int, invalidNumbers)
{
    ASSERT_FALSE(string2Int<int>("").has_value());
    ASSERT_FALSE(string2Int<int>("12abc").has_value());
    ASSERT_FALSE(string2Int<unsigned int>("-1").has_value());
}

TEST(string2IntWithUnitPrefix, units)
{
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("64K"), 64u * 1024);
    ASSERT_EQ(string2IntWithUnitPrefix<uint64_t>("2m"), 2u * 1024 * 1024);
    ASSERT_THROW(string2IntWithUnitPrefix<uint64_t>("3X"), UsageError);
}

/* ----------------------------------------------------------------------------
 * renderSize
 * --------------------------------------------------------------------------*/

TEST(renderSize, misc)
{
    ASSERT_EQ(renderSize(0), "0 B");
    ASSERT_EQ(renderSize(1000), "1000 B");
    ASSERT_EQ(renderSize(4096), "4.0 KiB");
    ASSERT_EQ(renderSize(5 * 1024 * 1024 + 512 * 1024), "5.5 MiB");
}

} // namespace fetchcache
