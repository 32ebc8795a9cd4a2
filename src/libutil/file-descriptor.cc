#include "fetchcache/util/file-descriptor.hh"
#include "fetchcache/util/serialise.hh"
#include "fetchcache/util/util.hh"

#include <fcntl.h>
#include <sys/stat.h>
#include <vector>
#include <unistd.h>

namespace fetchcache {

std::string readFile(Descriptor fd)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("statting file");

    std::string res;
    res.reserve(st.st_size);
    StringSink sink(std::move(res));
    drainFD(fd, sink);
    return std::move(sink.s);
}

void writeFull(Descriptor fd, std::string_view s)
{
    while (!s.empty()) {
        ssize_t res = write(fd, s.data(), s.size());
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file");
        }
        if (res > 0)
            s.remove_prefix(res);
    }
}

void drainFD(Descriptor fd, Sink & sink)
{
    std::vector<char> buf(64 * 1024);
    while (1) {
        ssize_t rd = read(fd, buf.data(), buf.size());
        if (rd == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading from file");
        } else if (rd == 0)
            break;
        else
            sink({buf.data(), (size_t) rd});
    }
}

//////////////////////////////////////////////////////////////////////

AutoCloseFD::AutoCloseFD()
    : fd{INVALID_DESCRIPTOR}
{
}

AutoCloseFD::AutoCloseFD(Descriptor fd)
    : fd{fd}
{
}

AutoCloseFD::AutoCloseFD(AutoCloseFD && that) noexcept
    : fd{that.fd}
{
    that.fd = INVALID_DESCRIPTOR;
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    close();
    fd = that.fd;
    that.fd = INVALID_DESCRIPTOR;
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (SysError &) {
        ignoreExceptionInDestructor();
    }
}

Descriptor AutoCloseFD::get() const
{
    return fd;
}

void AutoCloseFD::close()
{
    if (fd != INVALID_DESCRIPTOR) {
        if (::close(fd) == -1)
            /* This should never happen. */
            throw SysError("closing file descriptor %1%", fd);
        fd = INVALID_DESCRIPTOR;
    }
}

void AutoCloseFD::fsync() const
{
    if (fd != INVALID_DESCRIPTOR) {
        if (::fsync(fd) == -1)
            throw SysError("fsync file descriptor %1%", fd);
    }
}

AutoCloseFD::operator bool() const
{
    return fd != INVALID_DESCRIPTOR;
}

Descriptor AutoCloseFD::release()
{
    Descriptor oldFD = fd;
    fd = INVALID_DESCRIPTOR;
    return oldFD;
}

} // namespace fetchcache
