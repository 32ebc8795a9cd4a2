#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <limits>

#include "fetchcache/cache/cache-key.hh"
#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/cache/tests/fake-file-transfer.hh"
#include "fetchcache/util/charset.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/tests/capture-logger.hh"
#include "fetchcache/util/tests/gmock-matchers.hh"

namespace fetchcache {

using testing::CaptureLogging;
using testing::FakeFileTransfer;
using testing::HasSubstrIgnoreANSIMatcher;

static const std::string url = "https://example.com/releases/index.json";

class CachedFetcherTest : public ::testing::Test
{
protected:
    Path cacheRoot;
    AutoDelete delCacheRoot;
    FakeFileTransfer transfer;
    time_t now = 1700000000;
    std::unique_ptr<CachedFetcher> fetcher;
    CaptureLogging captureLogging;

    void SetUp() override
    {
        cacheRoot = createTempDir();
        delCacheRoot.reset(cacheRoot);
        fetcher = std::make_unique<CachedFetcher>(transfer, cacheRoot);
        fetcher->clock = [this]() { return now; };
    }

    void TearDown() override
    {
        cacheSettings.lockCacheEntries = true;
    }

    /**
     * Names of the files in the cache entry of `u`.
     */
    std::set<std::string> entryFiles(const std::string & u)
    {
        std::set<std::string> names;
        for (auto & e : std::filesystem::directory_iterator(fetcher->getStore().entryDir(deriveCacheKey(u))))
            names.insert(e.path().filename().string());
        return names;
    }
};

TEST_F(CachedFetcherTest, firstFetchStoresBody)
{
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "hello"});

    auto artifact = fetcher->fetch(url);

    ASSERT_EQ(artifact.url, url);
    ASSERT_FALSE(artifact.revalidated);
    ASSERT_EQ(readFile(artifact.dataPath), "hello");
    ASSERT_EQ(artifact.dataPath, fetcher->getStore().dataPath(deriveCacheKey(url)));
    ASSERT_EQ(artifact.metadata.source, url);
    ASSERT_EQ(artifact.metadata.timestamp, now);
    ASSERT_EQ(artifact.metadata.validators.etag, "\"v1\"");

    ASSERT_EQ(transfer.requests.size(), 1);
    ASSERT_TRUE(transfer.requests[0].headers.empty());

    ASSERT_EQ(fetcher->getStore().load(deriveCacheKey(url)), artifact.metadata);
    ASSERT_EQ(entryFiles(url), (std::set<std::string>{"data", "metadata", "lock"}));
}

TEST_F(CachedFetcherTest, notModifiedKeepsEntry)
{
    transfer.enqueue(
        url,
        {.status = 200,
         .headers = {{"ETag", "\"v1\""}, {"Last-Modified", "Tue, 14 Nov 2023 22:13:20 GMT"}},
         .body = "hello"});
    transfer.enqueue(url, {.status = 304});

    auto first = fetcher->fetch(url);
    now += 100;
    auto second = fetcher->fetch(url);

    ASSERT_EQ(transfer.requests.size(), 2);
    ASSERT_EQ(transfer.requests[1].header("If-None-Match"), "\"v1\"");
    ASSERT_EQ(transfer.requests[1].header("If-Modified-Since"), "Tue, 14 Nov 2023 22:13:20 GMT");

    ASSERT_TRUE(second.revalidated);
    ASSERT_EQ(second.dataPath, first.dataPath);
    ASSERT_EQ(readFile(second.dataPath), "hello");
    ASSERT_EQ(second.metadata, first.metadata);
    ASSERT_THAT(captureLogging.get().get(), HasSubstrIgnoreANSIMatcher("using cached copy of '" + url + "'"));
}

TEST_F(CachedFetcherTest, newBodyReplacesEntry)
{
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "hello"});
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v2\""}}, .body = "goodbye"});

    fetcher->fetch(url);
    now += 10;
    auto artifact = fetcher->fetch(url);

    ASSERT_FALSE(artifact.revalidated);
    ASSERT_EQ(readFile(artifact.dataPath), "goodbye");
    ASSERT_EQ(artifact.metadata.validators.etag, "\"v2\"");
    ASSERT_EQ(artifact.metadata.timestamp, now);
    ASSERT_EQ(fetcher->getStore().load(deriveCacheKey(url))->validators.etag, "\"v2\"");
}

TEST_F(CachedFetcherTest, errorStatusLeavesEntryAlone)
{
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "hello"});
    transfer.enqueue(url, {.status = 500, .body = "internal error"});

    auto first = fetcher->fetch(url);

    try {
        fetcher->fetch(url);
        FAIL() << "a 500 response should fail";
    } catch (HttpStatusError & e) {
        ASSERT_EQ(e.status, 500);
        ASSERT_EQ(e.error, FileTransfer::Transient);
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("HTTP error 500"));
        ASSERT_THAT(e.what(), HasSubstrIgnoreANSIMatcher("internal error"));
    }

    ASSERT_EQ(readFile(first.dataPath), "hello");
    ASSERT_EQ(fetcher->getStore().load(deriveCacheKey(url)), first.metadata);
    ASSERT_EQ(entryFiles(url), (std::set<std::string>{"data", "metadata", "lock"}));
}

TEST_F(CachedFetcherTest, notFound)
{
    try {
        fetcher->fetch(url);
        FAIL() << "a 404 response should fail";
    } catch (HttpStatusError & e) {
        ASSERT_EQ(e.status, 404);
        ASSERT_EQ(e.error, FileTransfer::NotFound);
    }

    ASSERT_FALSE(fetcher->getStore().load(deriveCacheKey(url)).has_value());
    ASSERT_FALSE(pathExists(fetcher->getStore().dataPath(deriveCacheKey(url))));
}

TEST_F(CachedFetcherTest, notModifiedWithoutEntry)
{
    transfer.enqueue(url, {.status = 304});

    ASSERT_THROW(fetcher->fetch(url), FileTransferError);
    ASSERT_FALSE(pathExists(fetcher->getStore().dataPath(deriveCacheKey(url))));
}

TEST_F(CachedFetcherTest, metadataWithoutDataIsRefetched)
{
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "hello"});
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "hello"});

    auto first = fetcher->fetch(url);
    deletePath(first.dataPath);

    auto second = fetcher->fetch(url);

    ASSERT_FALSE(transfer.requests[1].header("If-None-Match").has_value());
    ASSERT_FALSE(second.revalidated);
    ASSERT_EQ(readFile(second.dataPath), "hello");
    ASSERT_THAT(captureLogging.get().get(), HasSubstrIgnoreANSIMatcher("has metadata but no data"));
}

TEST_F(CachedFetcherTest, noStoreSendsNoValidators)
{
    transfer.enqueue(
        url, {.status = 200, .headers = {{"ETag", "\"v1\""}, {"Cache-Control", "no-store"}}, .body = "hello"});
    transfer.enqueue(url, {.status = 200, .body = "hello"});

    fetcher->fetch(url);
    fetcher->fetch(url);

    ASSERT_EQ(transfer.requests.size(), 2);
    ASSERT_TRUE(transfer.requests[1].headers.empty());
}

TEST_F(CachedFetcherTest, noCacheSendsValidators)
{
    transfer.enqueue(
        url, {.status = 200, .headers = {{"ETag", "\"v1\""}, {"Cache-Control", "no-cache"}}, .body = "hello"});
    transfer.enqueue(url, {.status = 304});

    fetcher->fetch(url);
    auto artifact = fetcher->fetch(url);

    ASSERT_EQ(transfer.requests[1].header("If-None-Match"), "\"v1\"");
    ASSERT_TRUE(artifact.revalidated);
}

TEST_F(CachedFetcherTest, maxAge)
{
    transfer.enqueue(
        url, {.status = 200, .headers = {{"ETag", "\"v1\""}, {"Cache-Control", "max-age=60"}}, .body = "hello"});
    transfer.enqueue(
        url, {.status = 200, .headers = {{"ETag", "\"v1\""}, {"Cache-Control", "max-age=60"}}, .body = "hello"});
    transfer.enqueue(url, {.status = 304});

    fetcher->fetch(url);

    /* Still fresh: the body is requested again without validators. */
    now += 30;
    fetcher->fetch(url);
    ASSERT_TRUE(transfer.requests[1].headers.empty());

    /* The second response restarted the clock at `now`. */
    now += 60;
    auto artifact = fetcher->fetch(url);
    ASSERT_EQ(transfer.requests[2].header("If-None-Match"), "\"v1\"");
    ASSERT_TRUE(artifact.revalidated);
}

TEST_F(CachedFetcherTest, hugeMaxAgeIsStored)
{
    transfer.enqueue(
        url, {.status = 200, .headers = {{"ETag", "\"v1\""}, {"Cache-Control", "max-age=99999999999999999"}}, .body = "B1"});
    transfer.enqueue(
        url,
        {.status = 200, .headers = {{"ETag", "\"v2\""}, {"Cache-Control", "max-age=9223372036854775807"}}, .body = "B2"});

    fetcher->fetch(url);
    auto artifact = fetcher->fetch(url);

    ASSERT_EQ(readFile(artifact.dataPath), "B2");
    ASSERT_EQ(artifact.metadata.cacheControl, CacheControl{CacheControl::Expires{now + 2147483648}});
    ASSERT_EQ(fetcher->getStore().load(deriveCacheKey(url)), artifact.metadata);
}

TEST_F(CachedFetcherTest, nonUtf8HeaderIsStored)
{
    std::string disposition = "attachment; filename=\"caf\xe9.bin\"";

    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "B1"});
    transfer.enqueue(
        url, {.status = 200, .headers = {{"ETag", "\"v2\""}, {"Content-Disposition", disposition}}, .body = "B2"});

    fetcher->fetch(url);
    auto artifact = fetcher->fetch(url);

    ASSERT_EQ(readFile(artifact.dataPath), "B2");
    auto stored = fetcher->getStore().load(deriveCacheKey(url));
    ASSERT_EQ(stored, artifact.metadata);
    ASSERT_EQ(stored->validators.etag, "\"v2\"");
    ASSERT_EQ(stored->header("content-disposition"), disposition);
}

TEST_F(CachedFetcherTest, failedMetadataWriteKeepsOldEntry)
{
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v1\""}}, .body = "B1"});
    transfer.enqueue(url, {.status = 200, .headers = {{"ETag", "\"v2\""}}, .body = "B2"});

    auto first = fetcher->fetch(url);

    /* A response time that cannot be written as a timestamp makes
       writing the new record fail. */
    now = std::numeric_limits<time_t>::max() / 2;
    ASSERT_THROW(fetcher->fetch(url), Error);

    ASSERT_EQ(readFile(first.dataPath), "B1");
    ASSERT_EQ(fetcher->getStore().load(deriveCacheKey(url)), first.metadata);
    ASSERT_EQ(entryFiles(url), (std::set<std::string>{"data", "metadata", "lock"}));
}

TEST_F(CachedFetcherTest, transportErrorPropagates)
{
    transfer.offline = true;

    try {
        fetcher->fetch(url);
        FAIL() << "an unreachable server should fail";
    } catch (FileTransferError & e) {
        ASSERT_EQ(e.error, FileTransfer::Transient);
    }

    ASSERT_FALSE(fetcher->getStore().load(deriveCacheKey(url)).has_value());
}

TEST_F(CachedFetcherTest, corruptMetadata)
{
    auto key = deriveCacheKey(url);
    createDirs(fetcher->getStore().entryDir(key));
    writeFile(fetcher->getStore().metadataPath(key), "garbage");

    ASSERT_THROW(fetcher->fetch(url), BadCacheMetadata);
    ASSERT_TRUE(transfer.requests.empty());
}

TEST_F(CachedFetcherTest, distinctUrlsDistinctEntries)
{
    transfer.enqueue(url, {.status = 200, .body = "one"});
    transfer.enqueue(url + "?v=2", {.status = 200, .body = "two"});

    auto a = fetcher->fetch(url);
    auto b = fetcher->fetch(url + "?v=2");

    ASSERT_NE(a.dataPath, b.dataPath);
    ASSERT_EQ(readFile(a.dataPath), "one");
    ASSERT_EQ(readFile(b.dataPath), "two");
}

TEST_F(CachedFetcherTest, withoutLocking)
{
    cacheSettings.lockCacheEntries = false;
    transfer.enqueue(url, {.status = 200, .body = "hello"});

    auto artifact = fetcher->fetch(url);

    ASSERT_EQ(readFile(artifact.dataPath), "hello");
    ASSERT_EQ(entryFiles(url), (std::set<std::string>{"data", "metadata"}));
}

/* ----------------------------------------------------------------------------
 * CachedArtifact
 * --------------------------------------------------------------------------*/

TEST_F(CachedFetcherTest, copyTo)
{
    transfer.enqueue(url, {.status = 200, .body = "hello"});
    auto artifact = fetcher->fetch(url);

    StringSink sink;
    ASSERT_EQ(artifact.copyTo(sink), 5);
    ASSERT_EQ(sink.s, "hello");
}

TEST_F(CachedFetcherTest, reader)
{
    transfer.enqueue(url, {.status = 200, .body = "hello"});
    auto artifact = fetcher->fetch(url);

    ASSERT_EQ(artifact.reader()->drain(), "hello");
}

TEST_F(CachedFetcherTest, copyToFile)
{
    transfer.enqueue(url, {.status = 200, .body = "hello"});
    auto artifact = fetcher->fetch(url);

    auto dest = cacheRoot + "/copy";
    writeFile(dest, "old contents");
    artifact.copyToFile(dest);

    ASSERT_EQ(readFile(dest), "hello");
}

TEST_F(CachedFetcherTest, textUsesCharset)
{
    transfer.enqueue(
        url, {.status = 200, .headers = {{"Content-Type", "text/plain; charset=ISO-8859-1"}}, .body = "caf\xe9"});

    ASSERT_EQ(fetcher->fetch(url).text(), "caf\xc3\xa9");
}

TEST_F(CachedFetcherTest, textDefaultsToUtf8)
{
    transfer.enqueue(url, {.status = 200, .headers = {{"Content-Type", "text/plain"}}, .body = "caf\xc3\xa9"});

    ASSERT_EQ(fetcher->fetch(url).text(), "caf\xc3\xa9");
}

TEST_F(CachedFetcherTest, textUnknownCharset)
{
    transfer.enqueue(
        url, {.status = 200, .headers = {{"Content-Type", "text/plain; charset=x-no-such-charset"}}, .body = "plain"});

    ASSERT_EQ(fetcher->fetch(url).text(), "plain");
    ASSERT_THAT(captureLogging.get().get(), HasSubstrIgnoreANSIMatcher("decoding '" + url + "' as UTF-8"));
}

TEST_F(CachedFetcherTest, textInvalidUtf8)
{
    transfer.enqueue(url, {.status = 200, .body = "caf\xe9"});

    ASSERT_THROW(fetcher->fetch(url).text(), DecodeError);
}

TEST_F(CachedFetcherTest, json)
{
    transfer.enqueue(url, {.status = 200, .body = R"({ "releases": [1, 2] })"});

    ASSERT_EQ(fetcher->fetch(url).json(), R"({ "releases": [1, 2] })"_json);
}

TEST_F(CachedFetcherTest, jsonInvalid)
{
    transfer.enqueue(url, {.status = 200, .body = "<html>"});

    ASSERT_THROW(fetcher->fetch(url).json(), Error);
}

} // namespace fetchcache
