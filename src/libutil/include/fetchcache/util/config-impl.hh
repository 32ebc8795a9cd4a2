#pragma once
/**
 * @file
 *
 * Template implementations (as opposed to mere declarations).
 *
 * One only needs to include this when one is declaring a
 * `BaseClass<CustomType>` setting, or as derived class of such an
 * instantiation.
 */

#include "fetchcache/util/util.hh"
#include "fetchcache/util/configuration.hh"

namespace fetchcache {

template<typename T>
T BaseSetting<T>::parse(const std::string & str) const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    try {
        return string2IntWithUnitPrefix<T>(str);
    } catch (UsageError &) {
        throw UsageError("setting '%s' has invalid value '%s'", name, str);
    }
}

template<typename T>
std::string BaseSetting<T>::to_string() const
{
    static_assert(std::is_integral<T>::value, "Integer required.");

    return std::to_string(value);
}

} // namespace fetchcache
