#include "fetchcache/cache/cache-key.hh"
#include "fetchcache/util/hash.hh"

namespace fetchcache {

CacheKey deriveCacheKey(std::string_view url)
{
    return CacheKey{hashString(HashAlgorithm::SHA256, url).to_string(HashFormat::Base16, false)};
}

} // namespace fetchcache
