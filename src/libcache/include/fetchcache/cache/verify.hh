#pragma once
///@file

#include "fetchcache/util/types.hh"

#include <string>
#include <variant>

namespace fetchcache {

/**
 * The checksum algorithms files can be verified with.
 */
extern const StringSet verifiableAlgorithms;

/**
 * The result of checking a file against an expected checksum.
 */
struct VerificationOutcome
{
    struct Valid
    {
        bool operator==(const Valid &) const = default;
    };

    struct DigestMismatch
    {
        std::string expected;
        std::string actual;

        bool operator==(const DigestMismatch &) const = default;
    };

    struct Missing
    {
        bool operator==(const Missing &) const = default;
    };

    struct UnsupportedAlgorithm
    {
        std::string name;

        bool operator==(const UnsupportedAlgorithm &) const = default;
    };

    typedef std::variant<Valid, DigestMismatch, Missing, UnsupportedAlgorithm> Raw;

    Raw raw;

    VerificationOutcome(Raw raw)
        : raw(std::move(raw))
    {
    }

    bool operator==(const VerificationOutcome &) const = default;

    bool isValid() const
    {
        return std::holds_alternative<Valid>(raw);
    }

    /**
     * A one-line description for reports, e.g. `valid` or
     * `checksum mismatch: expected ..., got ...`.
     */
    std::string to_string() const;
};

/**
 * Check the file at `path` against `expectedChecksum` (hexadecimal,
 * case and surrounding whitespace ignored) computed with `algorithm`.
 *
 * The algorithm is checked before the file is looked at, and a missing
 * file is reported without opening it. The file is hashed in chunks of
 * `verify-buffer-size` bytes, reporting progress after each one. I/O
 * errors other than the file not existing throw `SysError`.
 */
VerificationOutcome verifyFile(const Path & path, std::string_view expectedChecksum, std::string_view algorithm);

} // namespace fetchcache
