#pragma once
///@file

#include "fetchcache/util/file-descriptor.hh"
#include "fetchcache/util/types.hh"

namespace fetchcache {

/**
 * Open (possibly create) a lock file and return the file descriptor.
 * -1 is returned if create is false and the lock could not be opened
 * because it doesn't exist.  Any other error throws an exception.
 */
AutoCloseFD openLockFile(const Path & path, bool create);

enum LockType { ltRead, ltWrite, ltNone };

/**
 * Acquire or release an `flock()` on `desc`. Returns false if `wait`
 * is false and the lock is held by someone else.
 */
bool lockFile(Descriptor desc, LockType lockType, bool wait);

/**
 * An exclusive lock on one cache entry, held from construction until
 * `unlock()` or destruction. Processes updating the same entry are
 * serialised; different entries are independent.
 */
class EntryLock
{
private:
    AutoCloseFD fd;
    Path path;

public:
    /**
     * Lock the entry whose lock file is `lockPath`, creating the file
     * and its directory if necessary, and waiting for other holders.
     */
    EntryLock(const Path & lockPath);

    EntryLock(const EntryLock &) = delete;

    ~EntryLock();

    void unlock();

    bool isLocked() const
    {
        return (bool) fd;
    }
};

} // namespace fetchcache
