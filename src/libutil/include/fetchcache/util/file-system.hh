#pragma once
/**
 * @file
 *
 * Utilities for working with the file system and file paths.
 */

#include "fetchcache/util/types.hh"
#include "fetchcache/util/error.hh"
#include "fetchcache/util/file-descriptor.hh"

#include <filesystem>
#include <optional>

#include <sys/types.h>
#include <sys/stat.h>

namespace fetchcache {

struct Sink;
struct Source;

/**
 * @return An absolutized path, resolving paths relative to the
 * specified directory, or the current directory otherwise. The path
 * is also canonicalised.
 */
Path absPath(PathView path, std::optional<PathView> dir = {});

/**
 * Canonicalise a path by removing all `.` or `..` components and
 * double or trailing slashes.
 */
Path canonPath(PathView path);

/**
 * @return The directory part of the given canonical path, i.e.,
 * everything before the final `/`.  If the path is the root or an
 * immediate child thereof (e.g., `/foo`), this means `/`
 * is returned.
 */
Path dirOf(const PathView path);

/**
 * @return the base name of the given canonical path, i.e., everything
 * following the final `/` (trailing slashes are removed).
 */
std::string_view baseNameOf(std::string_view path);

/**
 * Get status of `path`.
 */
struct stat stat(const Path & path);

/**
 * `lstat` the given path if it exists.
 * @return std::nullopt if the path doesn't exist, or an optional containing the result of `lstat` otherwise
 */
std::optional<struct stat> maybeLstat(const Path & path);

/**
 * @return true iff the given path exists.
 */
bool pathExists(const Path & path);

/**
 * Read the contents of a file into a string.
 */
std::string readFile(const Path & path);

void readFile(const Path & path, Sink & sink);

enum struct FsSync { Yes, No };

/**
 * Write a string to a file.
 */
void writeFile(const Path & path, std::string_view s, mode_t mode = 0666, FsSync sync = FsSync::No);

void writeFile(const Path & path, Source & source, mode_t mode = 0666, FsSync sync = FsSync::No);

/**
 * Delete a path; i.e., in the case of a directory, it is deleted
 * recursively. It's not an error if the path does not exist.
 */
void deletePath(const Path & path);

/**
 * Create a directory and all its parents, if necessary.
 */
void createDirs(const Path & path);

/**
 * Rename a file, replacing the destination if it exists. Both paths
 * must be on the same file system.
 */
void renameFile(const Path & oldName, const Path & newName);

/**
 * Copy the contents of a regular file, replacing the destination.
 */
void copyFile(const Path & from, const Path & to);

/**
 * Automatic cleanup of resources.
 */
class AutoDelete
{
    Path _path;
    bool del;
    bool recursive;

public:
    AutoDelete();
    AutoDelete(const Path & p, bool recursive = true);
    AutoDelete(AutoDelete && x) noexcept
    {
        _path = std::move(x._path);
        del = x.del;
        recursive = x.recursive;
        x.del = false;
    }
    ~AutoDelete();

    void cancel();

    void reset(const Path & p, bool recursive = true);

    const Path & path() const
    {
        return _path;
    }

    operator Path() const
    {
        return _path;
    }
};

/**
 * Return `TMPDIR`, or the default temporary directory if unset or empty.
 */
Path defaultTempDir();

/**
 * Create a temporary directory.
 */
Path createTempDir(const Path & tmpRoot = "", const Path & prefix = "fetchcache", mode_t mode = 0755);

/**
 * Return temporary path constructed by appending a suffix to a root path.
 *
 * The constructed path looks like `<root><suffix>-<pid>-<unique>`. To create a
 * path nested in a directory, provide a suffix starting with `/`.
 */
Path makeTempPath(const Path & root, const Path & suffix = ".tmp");

} // namespace fetchcache
