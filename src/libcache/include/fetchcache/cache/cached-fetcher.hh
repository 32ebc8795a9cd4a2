#pragma once
///@file

#include "fetchcache/cache/filetransfer.hh"
#include "fetchcache/cache/metadata.hh"
#include "fetchcache/util/serialise.hh"

#include <nlohmann/json_fwd.hpp>

#include <ctime>
#include <functional>
#include <memory>

namespace fetchcache {

/**
 * A URL whose data is present in the cache, with the metadata of the
 * response it came from.
 */
struct CachedArtifact
{
    /**
     * The URL that was requested.
     */
    std::string url;

    /**
     * The cached body. Stays valid until the next fetch of `url`.
     */
    Path dataPath;

    CacheMetadata metadata;

    /**
     * Whether the origin answered 304 and the existing data was kept.
     */
    bool revalidated = false;

    /**
     * Open the cached data for reading.
     */
    std::unique_ptr<Source> reader() const;

    /**
     * Write the cached data to `sink`.
     *
     * @return the number of bytes written.
     */
    uint64_t copyTo(Sink & sink) const;

    /**
     * Copy the cached data to the file `dest`, replacing it.
     */
    void copyToFile(const Path & dest) const;

    /**
     * The data decoded as text, in the character set named by the
     * response's `Content-Type` (UTF-8 if it names none or one the
     * system does not know). Throws `DecodeError` on invalid input.
     */
    std::string text() const;

    /**
     * The data parsed as JSON. Throws `Error` if it is not JSON.
     */
    nlohmann::json json() const;
};

/**
 * Fetches URLs through the persistent HTTP cache, revalidating cached
 * data with the origin on every call.
 */
class CachedFetcher
{
    FileTransfer & fileTransfer;

    MetadataStore store;

public:

    /**
     * The current time. Replaceable for tests.
     */
    std::function<time_t()> clock = []() { return time(nullptr); };

    CachedFetcher(FileTransfer & fileTransfer, const Path & cacheRoot);

    /**
     * Fetch `url`, sending the stored validators allowed by the
     * entry's cache control policy. A 2xx response replaces the cache
     * entry, a 304 keeps it; any other status throws `HttpStatusError`
     * and leaves the entry alone.
     */
    CachedArtifact fetch(const std::string & url);

    const MetadataStore & getStore() const
    {
        return store;
    }
};

} // namespace fetchcache
