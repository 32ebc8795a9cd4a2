#pragma once
///@file

#include "fetchcache/cache/cache-control.hh"
#include "fetchcache/cache/cache-key.hh"
#include "fetchcache/util/error.hh"
#include "fetchcache/util/types.hh"

#include <nlohmann/json_fwd.hpp>

#include <map>

namespace fetchcache {

MakeError(BadCacheMetadata, Error);

/**
 * Everything remembered about the last successful response for a URL.
 * Replaced wholesale whenever the origin sends a new body.
 */
struct CacheMetadata
{
    /**
     * The URL the data was obtained from (after redirects).
     */
    std::string source;

    /**
     * When the response was received.
     */
    time_t timestamp = 0;

    Validators validators;

    CacheControl cacheControl;

    CacheType cacheType = CacheType::Private;

    /**
     * All response headers, by lower-case name, with their values in
     * the order they were received.
     */
    std::map<std::string, Strings> responseHeaders;

    /**
     * Build the metadata of a response with `headers` received for
     * `source` at time `now`.
     */
    static CacheMetadata fromResponse(const std::string & source, const Headers & headers, time_t now);

    /**
     * @return the first value of response header `name` (lower case).
     */
    std::optional<std::string> header(std::string_view name) const;

    /**
     * @return the validators to send with the next request, as decided
     * by `evaluateValidators()`.
     */
    Validators validatorsToForward(time_t now) const
    {
        return evaluateValidators(cacheControl, validators, now);
    }

    nlohmann::json toJSON() const;

    /**
     * Throws `BadCacheMetadata` if `json` is not a metadata record.
     */
    static CacheMetadata fromJSON(const nlohmann::json & json);

    bool operator==(const CacheMetadata &) const = default;
};

/**
 * Render `t` as an ISO-8601 UTC timestamp, e.g.
 * `2024-05-01T12:00:00Z`.
 */
std::string printTimestamp(time_t t);

/**
 * Inverse of `printTimestamp()`. Throws `Error` if `s` is malformed.
 */
time_t parseTimestamp(std::string_view s);

/**
 * The on-disk layout of the HTTP cache:
 *
 *     <root>/http/<key>/data
 *     <root>/http/<key>/metadata
 *     <root>/http/<key>/lock
 */
class MetadataStore
{
    Path httpDir;

public:

    MetadataStore(const Path & cacheRoot);

    Path entryDir(const CacheKey & key) const;
    Path dataPath(const CacheKey & key) const;
    Path metadataPath(const CacheKey & key) const;
    Path lockPath(const CacheKey & key) const;

    /**
     * Read the metadata record of `key`.
     *
     * @return `std::nullopt` if there is none. A record that exists
     * but cannot be parsed is reported as `BadCacheMetadata`.
     */
    std::optional<CacheMetadata> load(const CacheKey & key) const;

    /**
     * Replace the metadata record of `key`, creating the entry
     * directory if needed. Readers see either the old or the new
     * record, never a partial one.
     */
    void save(const CacheKey & key, const CacheMetadata & metadata) const;

    /**
     * Serialise `metadata` into a temporary file in the entry
     * directory of `key`, without replacing the current record.
     *
     * @return the temporary file, to be passed to `commit()`.
     */
    Path stage(const CacheKey & key, const CacheMetadata & metadata) const;

    /**
     * Make a record written by `stage()` the current one.
     */
    void commit(const CacheKey & key, const Path & staged) const;
};

} // namespace fetchcache
