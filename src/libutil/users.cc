#include "fetchcache/util/util.hh"
#include "fetchcache/util/users.hh"
#include "fetchcache/util/environment-variables.hh"
#include "fetchcache/util/file-system.hh"

#include <pwd.h>
#include <unistd.h>

namespace fetchcache {

Path getHomeOf(uid_t userId)
{
    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw;
    if (getpwuid_r(userId, &pwbuf, buf.data(), buf.size(), &pw) != 0 || !pw || !pw->pw_dir || !pw->pw_dir[0])
        throw Error("cannot determine user's home directory");
    return pw->pw_dir;
}

Path getHome()
{
    static Path homeDir = []() {
        auto homeDir = getEnvNonEmpty("HOME");
        if (!homeDir)
            homeDir = getHomeOf(geteuid());
        return *homeDir;
    }();
    return homeDir;
}

Path getCacheDir()
{
    auto dir = getEnvNonEmpty("FETCHCACHE_CACHE_HOME");
    if (dir) {
        return *dir;
    } else {
        auto xdgDir = getEnvNonEmpty("XDG_CACHE_HOME");
        if (xdgDir) {
            return *xdgDir + "/fetchcache";
        } else {
            return getHome() + "/.cache/fetchcache";
        }
    }
}

Path getConfigDir()
{
    auto dir = getEnvNonEmpty("FETCHCACHE_CONFIG_HOME");
    if (dir) {
        return *dir;
    } else {
        auto xdgDir = getEnvNonEmpty("XDG_CONFIG_HOME");
        if (xdgDir) {
            return *xdgDir + "/fetchcache";
        } else {
            return getHome() + "/.config/fetchcache";
        }
    }
}

std::vector<Path> getConfigDirs()
{
    Path configHome = getConfigDir();
    auto configDirs = getEnv("XDG_CONFIG_DIRS").value_or("/etc/xdg");
    auto tokens = tokenizeString<std::vector<std::string>>(configDirs, ":");
    std::vector<Path> result;
    result.push_back(configHome);
    for (auto & token : tokens) {
        result.push_back(token + "/fetchcache");
    }
    return result;
}

} // namespace fetchcache
