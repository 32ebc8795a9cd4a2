#pragma once
///@file

#include "fetchcache/util/types.hh"
#include "fetchcache/util/error.hh"

#include <unistd.h>

namespace fetchcache {

struct Sink;
struct Source;

/**
 * Operating System capability
 */
using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Read the contents of a resource into a string.
 */
std::string readFile(Descriptor fd);

/**
 * Wrapper around write() that writes exactly the requested number of
 * bytes.
 */
void writeFull(Descriptor fd, std::string_view s);

/**
 * Read a file descriptor until EOF occurs.
 */
void drainFD(Descriptor fd, Sink & sink);

[[gnu::always_inline]]
inline Descriptor getStandardOutput()
{
    return STDOUT_FILENO;
}

[[gnu::always_inline]]
inline Descriptor getStandardError()
{
    return STDERR_FILENO;
}

/**
 * Automatic cleanup of resources.
 */
class AutoCloseFD
{
    Descriptor fd;

public:
    AutoCloseFD();
    AutoCloseFD(Descriptor fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD && fd) noexcept;
    ~AutoCloseFD();
    AutoCloseFD & operator=(const AutoCloseFD & fd) = delete;
    AutoCloseFD & operator=(AutoCloseFD && fd);
    Descriptor get() const;
    explicit operator bool() const;
    Descriptor release();
    void close();

    /**
     * Perform a blocking fsync operation.
     */
    void fsync() const;
};

MakeError(EndOfFile, Error);

} // namespace fetchcache
