#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "fetchcache/cache/cache-key.hh"

namespace fetchcache {

TEST(deriveCacheKey, knownValue)
{
    ASSERT_EQ(
        deriveCacheKey("https://example.com/").to_string(),
        "0f115db062b7c0dd030b16878c99dea5c354b49dc37b38eb8846179c7783e9d7");
}

TEST(deriveCacheKey, noNormalisation)
{
    ASSERT_EQ(
        deriveCacheKey("https://example.com").to_string(),
        "100680ad546ce6a577f42f52df33b4cfdca756859e664b8d7de329b150d09ce9");
    ASSERT_NE(deriveCacheKey("https://example.com"), deriveCacheKey("https://example.com/"));
}

TEST(deriveCacheKey, emptyUrl)
{
    ASSERT_EQ(
        deriveCacheKey("").to_string(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

RC_GTEST_PROP(deriveCacheKey, deterministic, (const std::string & url))
{
    RC_ASSERT(deriveCacheKey(url) == deriveCacheKey(url));
}

RC_GTEST_PROP(deriveCacheKey, lowercaseHex, (const std::string & url))
{
    auto key = deriveCacheKey(url).to_string();
    RC_ASSERT(key.size() == 64u);
    for (auto c : key)
        RC_ASSERT((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'));
}

RC_GTEST_PROP(deriveCacheKey, distinctUrlsDistinctKeys, (const std::string & a, const std::string & b))
{
    RC_PRE(a != b);
    RC_ASSERT(deriveCacheKey(a) != deriveCacheKey(b));
}

} // namespace fetchcache
