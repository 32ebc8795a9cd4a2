#pragma once
///@file

#include "fetchcache/util/configuration.hh"

namespace fetchcache {

struct CacheSettings : public Config
{
    OptionalPathSetting cacheDir{
        this,
        std::nullopt,
        "cache-dir",
        R"(
          The directory holding the HTTP cache. If unset, the cache lives
          in `$FETCHCACHE_CACHE_HOME`, `$XDG_CACHE_HOME/fetchcache` or
          `~/.cache/fetchcache`, whichever is found first.
        )"};

    Setting<bool> lockCacheEntries{
        this,
        true,
        "lock-cache-entries",
        R"(
          Whether to take an exclusive lock on a cache entry while it is
          being revalidated, so that concurrent invocations for the same
          URL do not interleave their updates.
        )"};

    Setting<unsigned long> verifyBufferSize{
        this,
        64 * 1024,
        "verify-buffer-size",
        "The size (in bytes) of the chunks read when verifying a file's checksum."};

    /**
     * @return the root directory of the cache, with the `http`
     * subdirectory not yet appended.
     */
    Path getCacheRoot() const;
};

extern CacheSettings cacheSettings;

} // namespace fetchcache
