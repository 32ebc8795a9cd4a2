#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/util/config-global.hh"
#include "fetchcache/util/users.hh"

namespace fetchcache {

CacheSettings cacheSettings;

static GlobalConfig::Register rCacheSettings(&cacheSettings);

Path CacheSettings::getCacheRoot() const
{
    if (auto dir = cacheDir.get())
        return *dir;
    return getCacheDir();
}

} // namespace fetchcache
