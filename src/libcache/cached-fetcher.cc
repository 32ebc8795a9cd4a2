#include "fetchcache/cache/cached-fetcher.hh"
#include "fetchcache/cache/cache-key.hh"
#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/cache/entry-lock.hh"
#include "fetchcache/util/charset.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/util.hh"

#include <nlohmann/json.hpp>

#include <fcntl.h>

namespace fetchcache {

namespace {

/**
 * A source reading a file it owns.
 */
struct FileSource : Source
{
    AutoCloseFD fd;
    FdSource source;

    FileSource(AutoCloseFD && fd)
        : fd(std::move(fd))
        , source(this->fd.get())
    {
    }

    size_t read(char * data, size_t len) override
    {
        return static_cast<Source &>(source).read(data, len);
    }
};

} // anonymous namespace

std::unique_ptr<Source> CachedArtifact::reader() const
{
    AutoCloseFD fd = open(dataPath.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening cached data '%s' of '%s'", dataPath, url);
    return std::make_unique<FileSource>(std::move(fd));
}

uint64_t CachedArtifact::copyTo(Sink & sink) const
{
    uint64_t n = 0;
    LambdaSink counter([&](std::string_view data) {
        n += data.size();
        sink(data);
    });
    readFile(dataPath, counter);
    return n;
}

void CachedArtifact::copyToFile(const Path & dest) const
{
    copyFile(dataPath, dest);
}

std::string CachedArtifact::text() const
{
    auto data = readFile(dataPath);

    std::optional<std::string> charset;
    if (auto contentType = metadata.header("content-type"))
        charset = getCharsetParam(*contentType);

    if (charset) {
        try {
            return decodeToUtf8(data, *charset);
        } catch (UnknownCharset & e) {
            warn("%s; decoding '%s' as UTF-8", e.message(), url);
        }
    }

    return checkUtf8(data);
}

nlohmann::json CachedArtifact::json() const
{
    try {
        return nlohmann::json::parse(readFile(dataPath));
    } catch (nlohmann::json::parse_error & e) {
        throw Error("data of '%s' is not valid JSON: %s", url, e.what());
    }
}

CachedFetcher::CachedFetcher(FileTransfer & fileTransfer, const Path & cacheRoot)
    : fileTransfer(fileTransfer)
    , store(cacheRoot)
{
}

CachedArtifact CachedFetcher::fetch(const std::string & url)
{
    auto key = deriveCacheKey(url);
    auto dataPath = store.dataPath(key);

    std::optional<EntryLock> lock;
    if (cacheSettings.lockCacheEntries)
        lock.emplace(store.lockPath(key));
    else
        createDirs(store.entryDir(key));

    auto existing = store.load(key);
    if (existing && !pathExists(dataPath)) {
        warn("cache entry for '%s' has metadata but no data; fetching it again", url);
        existing.reset();
    }

    auto now = clock();

    FileTransferRequest request(url);
    if (existing) {
        auto validators = existing->validatorsToForward(now);
        if (validators.etag)
            request.headers.emplace_back("If-None-Match", *validators.etag);
        if (validators.lastModified)
            request.headers.emplace_back("If-Modified-Since", *validators.lastModified);
        if (validators.empty())
            debug("not revalidating '%s' (cache control '%s')", url, existing->cacheControl.typeName());
    }

    /* Download into a temporary file next to the data, so that
       the data is replaced atomically and only on success. */
    auto tmpPath = makeTempPath(dataPath);
    AutoDelete delTmp(tmpPath, false);

    FileTransferResult result;
    {
        AutoCloseFD fd = open(tmpPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0666);
        if (!fd)
            throw SysError("creating file '%s'", tmpPath);
        FdSink sink(fd.get());
        result = fileTransfer.download(request, sink);
        sink.flush();
        fd.close();
    }

    if (result.isSuccess()) {
        printInfo("downloaded '%s' into the cache (%s)", url, renderSize(result.bodySize));

        /* The new record is written before the data is replaced, so
           a failure leaves the old data and metadata in place. */
        auto metadata = CacheMetadata::fromResponse(
            result.effectiveUri.empty() ? url : result.effectiveUri, result.headers, now);
        auto stagedMetadata = store.stage(key, metadata);
        AutoDelete delStagedMetadata(stagedMetadata, false);

        renameFile(tmpPath, dataPath);
        delTmp.cancel();

        store.commit(key, stagedMetadata);
        delStagedMetadata.cancel();

        return CachedArtifact{.url = url, .dataPath = dataPath, .metadata = std::move(metadata)};
    }

    if (result.status == 304) {
        if (!existing)
            throw FileTransferError(
                FileTransfer::Misc,
                std::nullopt,
                "'%s' returned 304 Not Modified, but it is not in the cache",
                url);
        printInfo("using cached copy of '%s'", url);
        return CachedArtifact{.url = url, .dataPath = dataPath, .metadata = std::move(*existing), .revalidated = true};
    }

    throw HttpStatusError(url, result);
}

} // namespace fetchcache
