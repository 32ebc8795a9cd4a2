#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <rapidcheck/gtest.h>

#include <nlohmann/json.hpp>

#include <limits>

#include "fetchcache/cache/cache-key.hh"
#include "fetchcache/cache/metadata.hh"
#include "fetchcache/cache/tests/metadata.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/tests/gmock-matchers.hh"

namespace fetchcache {

using testing::HasSubstrIgnoreANSIMatcher;

static const time_t now = 1700000000;

/* ----------------------------------------------------------------------------
 * printTimestamp, parseTimestamp
 * --------------------------------------------------------------------------*/

TEST(printTimestamp, utc)
{
    ASSERT_EQ(printTimestamp(0), "1970-01-01T00:00:00Z");
    ASSERT_EQ(printTimestamp(now), "2023-11-14T22:13:20Z");
}

TEST(parseTimestamp, inverse)
{
    ASSERT_EQ(parseTimestamp("2023-11-14T22:13:20Z"), now);
    ASSERT_EQ(parseTimestamp(printTimestamp(now + 12345)), now + 12345);
}

TEST(parseTimestamp, malformed)
{
    ASSERT_THROW(parseTimestamp("yesterday"), Error);
    ASSERT_THROW(parseTimestamp("2023-11-14T22:13:20Z trailing"), Error);
    ASSERT_THROW(parseTimestamp(""), Error);
}

/* ----------------------------------------------------------------------------
 * CacheMetadata
 * --------------------------------------------------------------------------*/

TEST(CacheMetadata, fromResponse)
{
    auto md = CacheMetadata::fromResponse(
        "https://example.com/file",
        {
            {"ETag", "\"v1\""},
            {"Last-Modified", "Tue, 14 Nov 2023 22:13:20 GMT"},
            {"Cache-Control", "public"},
            {"cache-control", "max-age=60"},
            {"Content-Type", "application/json"},
        },
        now);

    ASSERT_EQ(md.source, "https://example.com/file");
    ASSERT_EQ(md.timestamp, now);
    ASSERT_EQ(md.validators.etag, "\"v1\"");
    ASSERT_EQ(md.validators.lastModified, "Tue, 14 Nov 2023 22:13:20 GMT");
    ASSERT_EQ(md.cacheControl, CacheControl{CacheControl::Expires{now + 60}});
    ASSERT_EQ(md.cacheType, CacheType::Public);
    ASSERT_EQ(md.header("content-type"), "application/json");
    ASSERT_EQ(md.responseHeaders["cache-control"], (Strings{"public", "max-age=60"}));
}

TEST(CacheMetadata, fromResponseWithoutHeaders)
{
    auto md = CacheMetadata::fromResponse("https://example.com/file", {}, now);

    ASSERT_TRUE(md.validators.empty());
    ASSERT_EQ(md.cacheControl, CacheControl{CacheControl::MustRevalidate{}});
    ASSERT_EQ(md.cacheType, CacheType::Private);
    ASSERT_FALSE(md.header("etag").has_value());
}

TEST(CacheMetadata, validatorsToForward)
{
    auto md = CacheMetadata::fromResponse(
        "https://example.com/file", {{"etag", "\"v1\""}, {"cache-control", "max-age=60"}}, now);

    ASSERT_TRUE(md.validatorsToForward(now + 30).empty());
    ASSERT_EQ(md.validatorsToForward(now + 60).etag, "\"v1\"");
}

TEST(CacheMetadata, jsonShape)
{
    auto md = CacheMetadata::fromResponse(
        "https://example.com/file", {{"etag", "\"v1\""}, {"cache-control", "max-age=60"}}, now);

    auto expected = R"({
        "version": 1,
        "source": "https://example.com/file",
        "timestamp": "2023-11-14T22:13:20Z",
        "etag": "\"v1\"",
        "last_modified": null,
        "cache_control": { "type": "expires", "expires": "2023-11-14T22:14:20Z" },
        "cache_type": "private",
        "response_headers": { "etag": ["\"v1\""], "cache-control": ["max-age=60"] }
    })"_json;

    ASSERT_EQ(md.toJSON(), expected);
}

TEST(CacheMetadata, jsonRoundTrip)
{
    auto md = CacheMetadata::fromResponse(
        "https://example.com/file",
        {{"etag", "W/\"weak\""}, {"last-modified", "Tue, 14 Nov 2023 22:13:20 GMT"}, {"cache-control", "no-cache"}},
        now);

    ASSERT_EQ(CacheMetadata::fromJSON(md.toJSON()), md);
}

TEST(CacheMetadata, fromResponseIgnoresInvalidFieldNames)
{
    auto md = CacheMetadata::fromResponse(
        "https://example.com/file", {{"X-Ok", "1"}, {"bad name", "2"}, {"caf\xe9", "3"}, {"", "4"}}, now);

    ASSERT_EQ(md.responseHeaders.size(), 1u);
    ASSERT_EQ(md.header("x-ok"), "1");
}

TEST(CacheMetadata, nonUtf8HeaderValues)
{
    auto md = CacheMetadata::fromResponse(
        "https://example.com/file",
        {{"ETag", "\"caf\xe9\""}, {"Content-Disposition", "attachment; filename=\"caf\xe9.bin\""}},
        now);

    auto json = md.toJSON();
    ASSERT_EQ(json["etag"], R"({ "latin1": "\"caf\u00e9\"" })"_json);
    ASSERT_EQ(
        json["response_headers"]["content-disposition"],
        R"([{ "latin1": "attachment; filename=\"caf\u00e9.bin\"" }])"_json);

    ASSERT_EQ(CacheMetadata::fromJSON(nlohmann::json::parse(json.dump())), md);
}

TEST(CacheMetadata, fromJSONRejectsBadLatin1)
{
    ASSERT_THROW(
        CacheMetadata::fromJSON(
            R"({ "version": 1, "source": "x", "timestamp": "2023-11-14T22:13:20Z", "etag": { "latin1": "\u20ac" } })"_json),
        BadCacheMetadata);
}

RC_GTEST_PROP(CacheMetadata, jsonRoundTripAny, (const CacheMetadata & md))
{
    RC_ASSERT(CacheMetadata::fromJSON(nlohmann::json::parse(md.toJSON().dump(2))) == md);
}

TEST(CacheMetadata, fromJSONMinimal)
{
    auto md = CacheMetadata::fromJSON(R"({
        "version": 1,
        "source": "https://example.com/file",
        "timestamp": "2023-11-14T22:13:20Z",
        "etag": null,
        "last_modified": null
    })"_json);

    ASSERT_EQ(md.cacheControl, CacheControl{CacheControl::MustRevalidate{}});
    ASSERT_EQ(md.cacheType, CacheType::Private);
    ASSERT_TRUE(md.responseHeaders.empty());
}

TEST(CacheMetadata, fromJSONRejectsBadRecords)
{
    ASSERT_THROW(CacheMetadata::fromJSON(R"([])"_json), BadCacheMetadata);
    ASSERT_THROW(
        CacheMetadata::fromJSON(R"({ "version": 2, "source": "x", "timestamp": "2023-11-14T22:13:20Z" })"_json),
        BadCacheMetadata);
    ASSERT_THROW(
        CacheMetadata::fromJSON(R"({ "version": 1, "source": "x", "timestamp": "noon" })"_json), BadCacheMetadata);
    ASSERT_THROW(
        CacheMetadata::fromJSON(
            R"({ "version": 1, "source": "x", "timestamp": "2023-11-14T22:13:20Z", "cache_control": { "type": "forever" } })"_json),
        BadCacheMetadata);
    ASSERT_THROW(
        CacheMetadata::fromJSON(
            R"({ "version": 1, "source": "x", "timestamp": "2023-11-14T22:13:20Z", "cache_type": "shared" })"_json),
        BadCacheMetadata);
}

/* ----------------------------------------------------------------------------
 * MetadataStore
 * --------------------------------------------------------------------------*/

class MetadataStoreTest : public ::testing::Test
{
protected:
    Path cacheRoot;
    AutoDelete delCacheRoot;

    void SetUp() override
    {
        cacheRoot = createTempDir();
        delCacheRoot.reset(cacheRoot);
    }
};

TEST_F(MetadataStoreTest, layout)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");

    ASSERT_EQ(store.entryDir(key), cacheRoot + "/http/" + key.to_string());
    ASSERT_EQ(store.dataPath(key), store.entryDir(key) + "/data");
    ASSERT_EQ(store.metadataPath(key), store.entryDir(key) + "/metadata");
    ASSERT_EQ(store.lockPath(key), store.entryDir(key) + "/lock");
}

TEST_F(MetadataStoreTest, loadMissing)
{
    MetadataStore store(cacheRoot);

    ASSERT_FALSE(store.load(deriveCacheKey("https://example.com/file")).has_value());
}

TEST_F(MetadataStoreTest, saveThenLoad)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");
    auto md = CacheMetadata::fromResponse("https://example.com/file", {{"etag", "\"v1\""}}, now);

    store.save(key, md);

    ASSERT_TRUE(pathExists(store.metadataPath(key)));
    ASSERT_EQ(store.load(key), md);
}

TEST_F(MetadataStoreTest, saveReplaces)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");

    store.save(key, CacheMetadata::fromResponse("https://example.com/file", {{"etag", "\"v1\""}}, now));
    auto md2 = CacheMetadata::fromResponse("https://example.com/file", {{"etag", "\"v2\""}}, now + 10);
    store.save(key, md2);

    ASSERT_EQ(store.load(key), md2);
}

RC_GTEST_PROP(MetadataStore, saveThenLoadAny, (const CacheMetadata & md))
{
    auto cacheRoot = createTempDir();
    AutoDelete delCacheRoot(cacheRoot);
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");

    store.save(key, md);
    RC_ASSERT(store.load(key) == std::optional(md));
}

TEST_F(MetadataStoreTest, stageDoesNotReplaceRecord)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");
    auto md1 = CacheMetadata::fromResponse("https://example.com/file", {{"etag", "\"v1\""}}, now);
    auto md2 = CacheMetadata::fromResponse("https://example.com/file", {{"etag", "\"v2\""}}, now + 10);

    store.save(key, md1);
    auto staged = store.stage(key, md2);

    ASSERT_TRUE(pathExists(staged));
    ASSERT_EQ(store.load(key), md1);

    store.commit(key, staged);

    ASSERT_FALSE(pathExists(staged));
    ASSERT_EQ(store.load(key), md2);
}

TEST_F(MetadataStoreTest, stageFailsBeforeWriting)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");
    auto md = CacheMetadata::fromResponse("https://example.com/file", {}, std::numeric_limits<time_t>::max() / 2);

    ASSERT_THROW(store.stage(key, md), Error);
    ASSERT_FALSE(pathExists(store.entryDir(key)));
}

TEST_F(MetadataStoreTest, corruptRecord)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");

    createDirs(store.entryDir(key));
    writeFile(store.metadataPath(key), "{ not json");

    ASSERT_THROW(store.load(key), BadCacheMetadata);
}

TEST_F(MetadataStoreTest, invalidRecordMentionsPath)
{
    MetadataStore store(cacheRoot);
    auto key = deriveCacheKey("https://example.com/file");

    createDirs(store.entryDir(key));
    writeFile(store.metadataPath(key), R"({ "version": 1 })");

    try {
        store.load(key);
        FAIL() << "loading an invalid record should fail";
    } catch (BadCacheMetadata & e) {
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("invalid cache metadata"));
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher(store.metadataPath(key)));
    }
}

} // namespace fetchcache
