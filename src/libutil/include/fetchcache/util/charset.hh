#pragma once
///@file

#include "fetchcache/util/error.hh"

#include <optional>
#include <string>

namespace fetchcache {

/**
 * Raised when bytes cannot be decoded in the requested character set.
 */
MakeError(DecodeError, Error);

/**
 * Raised when the C library has no converter for a character set name.
 */
MakeError(UnknownCharset, Error);

/**
 * Extract the `charset` parameter from a media type such as
 * `text/plain; charset="ISO-8859-1"`. Parameter names are matched
 * case-insensitively and quotes are stripped.
 */
std::optional<std::string> getCharsetParam(std::string_view contentType);

/**
 * Convert `data` from `charset` to UTF-8. Invalid or truncated input
 * throws `DecodeError`; an unknown charset name throws
 * `UnknownCharset`.
 */
std::string decodeToUtf8(std::string_view data, const std::string & charset);

/**
 * Check that `data` is well-formed UTF-8, returning it unchanged.
 */
std::string checkUtf8(std::string_view data);

/**
 * Interpret each byte of `data` as an ISO-8859-1 character. Never
 * fails.
 */
std::string latin1ToUtf8(std::string_view data);

/**
 * Inverse of `latin1ToUtf8()`. Throws `DecodeError` if `data` is not
 * UTF-8 or contains characters above U+00FF.
 */
std::string utf8ToLatin1(std::string_view data);

} // namespace fetchcache
