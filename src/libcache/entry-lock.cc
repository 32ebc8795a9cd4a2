#include "fetchcache/cache/entry-lock.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/util.hh"

#include <cerrno>

#include <fcntl.h>
#include <sys/file.h>

namespace fetchcache {

AutoCloseFD openLockFile(const Path & path, bool create)
{
    AutoCloseFD fd = open(path.c_str(), O_CLOEXEC | O_RDWR | (create ? O_CREAT : 0), 0600);
    if (!fd && (create || errno != ENOENT))
        throw SysError("opening lock file '%1%'", path);

    return fd;
}

bool lockFile(Descriptor desc, LockType lockType, bool wait)
{
    int type;
    if (lockType == ltRead)
        type = LOCK_SH;
    else if (lockType == ltWrite)
        type = LOCK_EX;
    else
        type = LOCK_UN;

    if (wait) {
        while (flock(desc, type) != 0) {
            if (errno != EINTR)
                throw SysError("acquiring/releasing lock");
        }
    } else {
        while (flock(desc, type | LOCK_NB) != 0) {
            if (errno == EWOULDBLOCK)
                return false;
            if (errno != EINTR)
                throw SysError("acquiring/releasing lock");
        }
    }

    return true;
}

EntryLock::EntryLock(const Path & lockPath)
    : path(lockPath)
{
    createDirs(dirOf(lockPath));

    debug("locking cache entry '%s'", lockPath);

    fd = openLockFile(lockPath, true);

    if (!lockFile(fd.get(), ltWrite, false)) {
        printInfo("waiting for lock on '%s'...", lockPath);
        lockFile(fd.get(), ltWrite, true);
    }
}

EntryLock::~EntryLock()
{
    try {
        unlock();
    } catch (SysError &) {
        ignoreExceptionInDestructor();
    }
}

void EntryLock::unlock()
{
    if (!fd)
        return;
    /* The lock file is kept, since another process may already have
       opened it and be waiting for the lock. Closing the descriptor
       releases the lock. */
    debug("unlocking cache entry '%s'", path);
    fd.close();
}

} // namespace fetchcache
