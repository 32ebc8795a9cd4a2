#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include "fetchcache/cache/cache-control.hh"

#include <limits>

namespace fetchcache {

static const time_t now = 1700000000;

/* ----------------------------------------------------------------------------
 * CacheControl::parse
 * --------------------------------------------------------------------------*/

TEST(CacheControl, missingHeaderMustRevalidate)
{
    ASSERT_EQ(CacheControl::parse({}, now), CacheControl{CacheControl::MustRevalidate{}});
    ASSERT_EQ(CacheControl(), CacheControl{CacheControl::MustRevalidate{}});
}

TEST(CacheControl, maxAge)
{
    ASSERT_EQ(CacheControl::parse({"max-age=3600"}, now), CacheControl{CacheControl::Expires{now + 3600}});
}

TEST(CacheControl, maxAgeZero)
{
    ASSERT_EQ(CacheControl::parse({"max-age=0"}, now), CacheControl{CacheControl::Expires{now}});
}

TEST(CacheControl, maxAgeQuotedAndCaseInsensitive)
{
    ASSERT_EQ(CacheControl::parse({"Max-Age=\"60\""}, now), CacheControl{CacheControl::Expires{now + 60}});
}

TEST(CacheControl, firstMaxAgeWins)
{
    ASSERT_EQ(
        CacheControl::parse({"max-age=60, max-age=120"}, now), CacheControl{CacheControl::Expires{now + 60}});
}

TEST(CacheControl, malformedMaxAgeMustRevalidate)
{
    ASSERT_EQ(CacheControl::parse({"max-age=soon"}, now), CacheControl{CacheControl::MustRevalidate{}});
    ASSERT_EQ(CacheControl::parse({"max-age=-5"}, now), CacheControl{CacheControl::MustRevalidate{}});
    ASSERT_EQ(CacheControl::parse({"max-age"}, now), CacheControl{CacheControl::MustRevalidate{}});
}

TEST(CacheControl, hugeMaxAgeIsCapped)
{
    auto capped = CacheControl{CacheControl::Expires{now + 2147483648}};
    ASSERT_EQ(CacheControl::parse({"max-age=2147483648"}, now), capped);
    ASSERT_EQ(CacheControl::parse({"max-age=99999999999999999"}, now), capped);
    ASSERT_EQ(CacheControl::parse({"max-age=9223372036854775807"}, now), capped);
    ASSERT_EQ(CacheControl::parse({"max-age=123456789012345678901234567890"}, now), capped);
    ASSERT_EQ(
        CacheControl::parse({"max-age=2147483647"}, now), CacheControl{CacheControl::Expires{now + 2147483647}});
}

TEST(CacheControl, maxAgeSaturatesAtEndOfTime)
{
    auto end = std::numeric_limits<time_t>::max();
    ASSERT_EQ(CacheControl::parse({"max-age=9223372036854775807"}, end - 10), CacheControl{CacheControl::Expires{end}});
}

TEST(CacheControl, unknownDirectivesMustRevalidate)
{
    ASSERT_EQ(
        CacheControl::parse({"immutable, stale-while-revalidate=30"}, now),
        CacheControl{CacheControl::MustRevalidate{}});
}

TEST(CacheControl, noStoreTakesPrecedence)
{
    ASSERT_EQ(
        CacheControl::parse({"max-age=3600, no-cache", "no-store"}, now), CacheControl{CacheControl::NoStore{}});
}

TEST(CacheControl, noCacheBeforeMaxAge)
{
    ASSERT_EQ(CacheControl::parse({"max-age=3600, no-cache"}, now), CacheControl{CacheControl::NoCache{}});
}

TEST(CacheControl, multipleHeaderValues)
{
    ASSERT_EQ(CacheControl::parse({"public", "max-age=10"}, now), CacheControl{CacheControl::Expires{now + 10}});
}

TEST(CacheControl, typeName)
{
    ASSERT_EQ(CacheControl{CacheControl::NoStore{}}.typeName(), "no-store");
    ASSERT_EQ(CacheControl{CacheControl::NoCache{}}.typeName(), "no-cache");
    ASSERT_EQ(CacheControl{CacheControl::Expires{now}}.typeName(), "expires");
    ASSERT_EQ(CacheControl{CacheControl::MustRevalidate{}}.typeName(), "must-revalidate");
}

RC_GTEST_PROP(CacheControl, neverThrows, (const std::string & header))
{
    auto policy = CacheControl::parse({header}, now);
    RC_ASSERT(!policy.typeName().empty());
}

RC_GTEST_PROP(CacheControl, expiryWithinCap, (uint64_t seconds))
{
    auto policy = CacheControl::parse({"max-age=" + std::to_string(seconds)}, now);
    auto expires = std::get_if<CacheControl::Expires>(&policy.raw);
    RC_ASSERT(expires);
    RC_ASSERT(expires->at >= now);
    RC_ASSERT(expires->at <= now + 2147483648);
}

/* ----------------------------------------------------------------------------
 * parseCacheType
 * --------------------------------------------------------------------------*/

TEST(parseCacheType, defaultsToPrivate)
{
    ASSERT_EQ(parseCacheType({}), CacheType::Private);
    ASSERT_EQ(parseCacheType({"max-age=10"}), CacheType::Private);
    ASSERT_EQ(parseCacheType({"private, max-age=10"}), CacheType::Private);
}

TEST(parseCacheType, publicDirective)
{
    ASSERT_EQ(parseCacheType({"max-age=10, Public"}), CacheType::Public);
}

TEST(parseCacheType, names)
{
    ASSERT_EQ(printCacheType(CacheType::Public), "public");
    ASSERT_EQ(parseCacheTypeOpt("private"), CacheType::Private);
    ASSERT_FALSE(parseCacheTypeOpt("shared").has_value());
}

/* ----------------------------------------------------------------------------
 * evaluateValidators
 * --------------------------------------------------------------------------*/

static const Validators stored{.etag = "\"v1\"", .lastModified = "Tue, 14 Nov 2023 22:13:20 GMT"};

TEST(evaluateValidators, noStoreForwardsNothing)
{
    ASSERT_TRUE(evaluateValidators(CacheControl{CacheControl::NoStore{}}, stored, now).empty());
}

TEST(evaluateValidators, noCacheForwardsEverything)
{
    ASSERT_EQ(evaluateValidators(CacheControl{CacheControl::NoCache{}}, stored, now), stored);
}

TEST(evaluateValidators, mustRevalidateForwardsEverything)
{
    ASSERT_EQ(evaluateValidators(CacheControl{CacheControl::MustRevalidate{}}, stored, now), stored);
}

TEST(evaluateValidators, unexpiredForwardsNothing)
{
    ASSERT_TRUE(evaluateValidators(CacheControl{CacheControl::Expires{now + 1}}, stored, now).empty());
}

TEST(evaluateValidators, expiredForwardsEverything)
{
    ASSERT_EQ(evaluateValidators(CacheControl{CacheControl::Expires{now}}, stored, now), stored);
    ASSERT_EQ(evaluateValidators(CacheControl{CacheControl::Expires{now - 100}}, stored, now), stored);
}

TEST(evaluateValidators, partialValidators)
{
    Validators etagOnly{.etag = "\"abc\"", .lastModified = std::nullopt};
    ASSERT_EQ(evaluateValidators(CacheControl{CacheControl::NoCache{}}, etagOnly, now), etagOnly);
}

TEST(evaluateValidators, nothingStored)
{
    ASSERT_TRUE(evaluateValidators(CacheControl{CacheControl::MustRevalidate{}}, Validators{}, now).empty());
}

RC_GTEST_PROP(evaluateValidators, neverInventsValidators, (int64_t offset, bool haveEtag, bool haveLastModified))
{
    Validators v;
    if (haveEtag)
        v.etag = "\"x\"";
    if (haveLastModified)
        v.lastModified = "Mon, 01 Jan 2024 00:00:00 GMT";

    auto res = evaluateValidators(CacheControl{CacheControl::Expires{now + offset % 100000}}, v, now);
    RC_ASSERT(res.empty() || res == v);
}

} // namespace fetchcache
