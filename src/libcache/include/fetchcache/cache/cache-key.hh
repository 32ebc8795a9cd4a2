#pragma once
///@file

#include <compare>
#include <string>
#include <string_view>

namespace fetchcache {

/**
 * The name of a cache entry: the lower-case base-16 SHA-256 digest of
 * the URL it caches. The same URL always maps to the same key, across
 * runs and machines.
 */
struct CacheKey
{
    std::string digest;

    const std::string & to_string() const
    {
        return digest;
    }

    bool operator==(const CacheKey &) const = default;
    auto operator<=>(const CacheKey &) const = default;
};

/**
 * Derive the cache key of `url`. The URL is hashed exactly as given,
 * without normalisation.
 */
CacheKey deriveCacheKey(std::string_view url);

} // namespace fetchcache
