#pragma once
///@file

#include "fetchcache/util/error.hh"

namespace fetchcache {

MakeError(BadURL, Error);

/**
 * Resolve the reference `ref` against the absolute URL `base`, as a
 * browser resolves a link found in the document at `base`. An
 * absolute `ref` is returned in normalised form.
 */
std::string resolveUrl(const std::string & base, const std::string & ref);

/**
 * Parse and normalise an absolute URL. Throws `BadURL` if `url` is
 * not an absolute URL.
 */
std::string normaliseUrl(const std::string & url);

} // namespace fetchcache
