#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/environment-variables.hh"
#include "fetchcache/util/serialise.hh"
#include "fetchcache/util/util.hh"

#include <array>
#include <climits>
#include <atomic>
#include <random>

#include <fcntl.h>
#include <unistd.h>

namespace fetchcache {

Path absPath(PathView path, std::optional<PathView> dir)
{
    std::string scratch;

    if (path.empty() || path[0] != '/') {
        if (!dir) {
            char buf[PATH_MAX];
            if (!getcwd(buf, sizeof(buf)))
                throw SysError("cannot get cwd");
            scratch = concatStringsSep("/", Strings{buf, std::string(path)});
        } else
            scratch = concatStringsSep("/", Strings{std::string(*dir), std::string(path)});
        path = scratch;
    }
    return canonPath(path);
}

Path canonPath(PathView path)
{
    if (path.empty() || path[0] != '/')
        throw Error("not an absolute path: '%1%'", path);

    Strings components;
    for (auto & c : tokenizeString<Strings>(path, "/")) {
        if (c == ".")
            continue;
        if (c == "..") {
            if (!components.empty())
                components.pop_back();
            continue;
        }
        components.push_back(c);
    }

    return "/" + concatStringsSep("/", components);
}

Path dirOf(const PathView path)
{
    Path::size_type pos = path.rfind('/');
    if (pos == path.npos)
        return ".";
    return pos == 0 ? "/" : Path(path, 0, pos);
}

std::string_view baseNameOf(std::string_view path)
{
    if (path.empty())
        return "";

    auto last = path.size() - 1;
    while (last > 0 && path[last] == '/')
        last -= 1;

    auto pos = path.rfind('/', last);
    if (pos == path.npos)
        pos = 0;
    else
        pos += 1;

    return path.substr(pos, last - pos + 1);
}

struct stat stat(const Path & path)
{
    struct stat st;
    if (::stat(path.c_str(), &st))
        throw SysError("getting status of '%1%'", path);
    return st;
}

std::optional<struct stat> maybeLstat(const Path & path)
{
    std::optional<struct stat> st{std::in_place};
    if (::lstat(path.c_str(), &*st)) {
        if (errno == ENOENT || errno == ENOTDIR)
            st.reset();
        else
            throw SysError("getting status of '%s'", path);
    }
    return st;
}

bool pathExists(const Path & path)
{
    return maybeLstat(path).has_value();
}

std::string readFile(const Path & path)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%1%'", path);
    return readFile(fd.get());
}

void readFile(const Path & path, Sink & sink)
{
    AutoCloseFD fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (!fd)
        throw SysError("opening file '%s'", path);
    drainFD(fd.get(), sink);
}

void writeFile(const Path & path, std::string_view s, mode_t mode, FsSync sync)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%1%'", path);

    try {
        writeFull(fd.get(), s);

        if (sync == FsSync::Yes)
            fd.fsync();

    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }

    /* Close explicitly to propagate the exceptions. */
    fd.close();
}

void writeFile(const Path & path, Source & source, mode_t mode, FsSync sync)
{
    AutoCloseFD fd = open(path.c_str(), O_WRONLY | O_TRUNC | O_CREAT | O_CLOEXEC, mode);
    if (!fd)
        throw SysError("opening file '%1%'", path);

    std::array<char, 64 * 1024> buf;

    try {
        while (true) {
            size_t n;
            try {
                n = source.read(buf.data(), buf.size());
            } catch (EndOfFile &) {
                break;
            }
            writeFull(fd.get(), {buf.data(), n});
        }
    } catch (Error & e) {
        e.addTrace("writing file '%1%'", path);
        throw;
    }
    if (sync == FsSync::Yes)
        fd.fsync();
    // Explicitly close to make sure exceptions are propagated.
    fd.close();
}

void deletePath(const Path & path)
{
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec)
        throw SysError(ec.value(), "deleting '%1%'", path);
}

void createDirs(const Path & path)
{
    std::error_code ec;
    std::filesystem::create_directories(path, ec);
    if (ec)
        throw SysError(ec.value(), "creating directory '%1%'", path);
}

void renameFile(const Path & oldName, const Path & newName)
{
    if (rename(oldName.c_str(), newName.c_str()) == -1)
        throw SysError("renaming '%1%' to '%2%'", oldName, newName);
}

void copyFile(const Path & from, const Path & to)
{
    std::error_code ec;
    std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec)
        throw SysError(ec.value(), "copying '%1%' to '%2%'", from, to);
}

//////////////////////////////////////////////////////////////////////

AutoDelete::AutoDelete()
    : del{false}
{
}

AutoDelete::AutoDelete(const Path & p, bool recursive)
    : _path(p)
{
    del = true;
    this->recursive = recursive;
}

AutoDelete::~AutoDelete()
{
    try {
        if (del) {
            if (recursive)
                deletePath(_path);
            else if (unlink(_path.c_str()) == -1 && errno != ENOENT)
                throw SysError("cannot unlink '%1%'", _path);
        }
    } catch (SysError &) {
        ignoreExceptionInDestructor();
    }
}

void AutoDelete::cancel()
{
    del = false;
}

void AutoDelete::reset(const Path & p, bool recursive)
{
    _path = p;
    this->recursive = recursive;
    del = true;
}

//////////////////////////////////////////////////////////////////////

Path defaultTempDir()
{
    return getEnvNonEmpty("TMPDIR").value_or("/tmp");
}

Path createTempDir(const Path & tmpRoot, const Path & prefix, mode_t mode)
{
    while (1) {
        Path tmpDir = makeTempPath(tmpRoot.empty() ? defaultTempDir() : tmpRoot, "/" + prefix);
        if (mkdir(tmpDir.c_str(), mode) == 0)
            return tmpDir;
        if (errno != EEXIST)
            throw SysError("creating directory '%1%'", tmpDir);
    }
}

Path makeTempPath(const Path & root, const Path & suffix)
{
    // start the counter at a random value to minimize issues with preexisting temp paths
    static std::atomic<uint32_t> counter(std::random_device{}());
    return fmt("%1%%2%-%3%-%4%", root, suffix, getpid(), counter.fetch_add(1, std::memory_order_relaxed));
}

} // namespace fetchcache
