#pragma once
///@file

#include <rapidcheck/gen/Arbitrary.h>

#include "fetchcache/cache/metadata.hh"

namespace rc {
using namespace fetchcache;

/**
 * Cache control policies, with expiry times that `printTimestamp()`
 * can render.
 */
template<>
struct Arbitrary<CacheControl>
{
    static Gen<CacheControl> arbitrary();
};

/**
 * Metadata records whose source, validators and header values are
 * arbitrary bytes.
 */
template<>
struct Arbitrary<CacheMetadata>
{
    static Gen<CacheMetadata> arbitrary();
};

} // namespace rc
