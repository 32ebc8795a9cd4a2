#pragma once
///@file

#include "fetchcache/util/types.hh"

#include <ctime>
#include <optional>
#include <string>
#include <variant>

namespace fetchcache {

/**
 * What the origin said about reusing a response, taken from the
 * `Cache-Control` header of the most recent response.
 */
struct CacheControl
{
    /**
     * The response must not be reused; revalidation is pointless.
     */
    struct NoStore
    {
        bool operator==(const NoStore &) const = default;
    };

    /**
     * The response may be kept but must be revalidated before use.
     */
    struct NoCache
    {
        bool operator==(const NoCache &) const = default;
    };

    /**
     * The response is fresh until `at`, derived from `max-age`.
     */
    struct Expires
    {
        time_t at;

        bool operator==(const Expires &) const = default;
    };

    /**
     * The response must be revalidated. This is also the fallback for
     * missing or unintelligible headers.
     */
    struct MustRevalidate
    {
        bool operator==(const MustRevalidate &) const = default;
    };

    typedef std::variant<NoStore, NoCache, Expires, MustRevalidate> Raw;

    Raw raw;

    CacheControl()
        : raw(MustRevalidate{})
    {
    }

    CacheControl(Raw raw)
        : raw(std::move(raw))
    {
    }

    bool operator==(const CacheControl &) const = default;

    /**
     * Parse the values of all `Cache-Control` headers of a response.
     * `max-age` is made absolute relative to `now`. Precedence is
     * `no-store`, then `no-cache`, then `max-age`; everything else
     * yields `MustRevalidate`.
     */
    static CacheControl parse(const Strings & headerValues, time_t now);

    /**
     * The name of the variant as stored in cache metadata:
     * `no-store`, `no-cache`, `expires` or `must-revalidate`.
     */
    std::string_view typeName() const;
};

/**
 * Whether a cached response is meant for a shared cache. Recorded
 * only; both are handled the same way.
 */
enum struct CacheType { Public, Private };

/**
 * Determine the cache type from `public` / `private` directives.
 * Responses that say neither are private.
 */
CacheType parseCacheType(const Strings & headerValues);

std::string_view printCacheType(CacheType type);

std::optional<CacheType> parseCacheTypeOpt(std::string_view s);

/**
 * The validators of a cached response, as sent back to the origin in
 * `If-None-Match` and `If-Modified-Since`.
 */
struct Validators
{
    std::optional<std::string> etag;
    std::optional<std::string> lastModified;

    bool empty() const
    {
        return !etag && !lastModified;
    }

    bool operator==(const Validators &) const = default;
};

/**
 * Decide which of the `stored` validators to send with the next
 * request for an entry with policy `policy`.
 *
 * `NoStore` forwards nothing. So does an unexpired `Expires`: the
 * origin is asked for the full body again rather than trusting
 * `max-age`. `NoCache`, `MustRevalidate` and an expired `Expires`
 * forward everything stored.
 */
Validators evaluateValidators(const CacheControl & policy, const Validators & stored, time_t now);

} // namespace fetchcache
