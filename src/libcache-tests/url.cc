#include <gtest/gtest.h>

#include "fetchcache/cache/url.hh"

namespace fetchcache {

static const std::string base = "https://example.com/sdk/releases/index.json";

TEST(resolveUrl, sibling)
{
    ASSERT_EQ(resolveUrl(base, "r1.json"), "https://example.com/sdk/releases/r1.json");
    ASSERT_EQ(resolveUrl(base, "./r1.json"), "https://example.com/sdk/releases/r1.json");
}

TEST(resolveUrl, parent)
{
    ASSERT_EQ(resolveUrl(base, "../files/a.zip"), "https://example.com/sdk/files/a.zip");
}

TEST(resolveUrl, absolutePath)
{
    ASSERT_EQ(resolveUrl(base, "/other/a.zip"), "https://example.com/other/a.zip");
}

TEST(resolveUrl, absoluteUrl)
{
    ASSERT_EQ(resolveUrl(base, "https://mirror.example.org/a.zip"), "https://mirror.example.org/a.zip");
}

TEST(resolveUrl, query)
{
    ASSERT_EQ(resolveUrl(base, "r1.json?v=2"), "https://example.com/sdk/releases/r1.json?v=2");
}

TEST(resolveUrl, invalidBase)
{
    ASSERT_THROW(resolveUrl("sdk/releases/index.json", "r1.json"), BadURL);
}

TEST(normaliseUrl, removesDotSegments)
{
    ASSERT_EQ(normaliseUrl("https://example.com/a/./b/../c"), "https://example.com/a/c");
}

TEST(normaliseUrl, addsRootPath)
{
    ASSERT_EQ(normaliseUrl("https://example.com"), "https://example.com/");
}

TEST(normaliseUrl, keepsQuery)
{
    ASSERT_EQ(normaliseUrl("https://example.com/a?b=c"), "https://example.com/a?b=c");
}

TEST(normaliseUrl, notAbsolute)
{
    ASSERT_THROW(normaliseUrl("index.json"), BadURL);
}

} // namespace fetchcache
