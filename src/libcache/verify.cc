#include "fetchcache/cache/verify.hh"
#include "fetchcache/cache/cache-settings.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/hash.hh"
#include "fetchcache/util/util.hh"

#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fetchcache {

const StringSet verifiableAlgorithms = {"md5"};

std::string VerificationOutcome::to_string() const
{
    return std::visit(
        overloaded{
            [](const Valid &) -> std::string { return "valid"; },
            [](const DigestMismatch & m) -> std::string {
                return fmt("checksum mismatch: expected '%s', got '%s'", m.expected, m.actual);
            },
            [](const Missing &) -> std::string { return "file is missing"; },
            [](const UnsupportedAlgorithm & u) -> std::string {
                return fmt("unsupported checksum type '%s'", u.name);
            },
        },
        raw);
}

VerificationOutcome verifyFile(const Path & path, std::string_view expectedChecksum, std::string_view algorithm)
{
    auto algoName = toLower(std::string(algorithm));
    if (!verifiableAlgorithms.count(algoName))
        return VerificationOutcome{VerificationOutcome::UnsupportedAlgorithm{std::string(algorithm)}};
    auto ha = parseHashAlgo(algoName);

    auto st = maybeLstat(path);
    if (!st)
        return VerificationOutcome{VerificationOutcome::Missing{}};

    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd) {
        /* A dangling symlink. */
        if (errno == ENOENT)
            return VerificationOutcome{VerificationOutcome::Missing{}};
        throw SysError("opening file '%s'", path);
    }

    /* Use the size of the file we opened, not of a symlink. */
    struct stat fst;
    if (fstat(fd.get(), &fst))
        throw SysError("getting status of '%s'", path);
    uint64_t size = fst.st_size;

    size_t bufSize = cacheSettings.verifyBufferSize;
    if (bufSize == 0)
        throw UsageError("'verify-buffer-size' must be greater than zero");

    Activity act(*logger, lvlTalkative, actVerifyFile, fmt("verifying '%s'", path), {path});

    HashSink hashSink(ha);
    std::vector<char> buf(bufSize);
    uint64_t done = 0;

    while (true) {
        auto n = ::read(fd.get(), buf.data(), buf.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading file '%s'", path);
        }
        if (n == 0)
            break;
        hashSink({buf.data(), (size_t) n});
        done += n;
        act.progress(done, size);
    }

    auto actual = hashSink.finish().hash.to_string(HashFormat::Base16, false);
    auto expected = toLower(trim(expectedChecksum));

    if (actual == expected)
        return VerificationOutcome{VerificationOutcome::Valid{}};

    return VerificationOutcome{VerificationOutcome::DigestMismatch{.expected = expected, .actual = actual}};
}

} // namespace fetchcache
