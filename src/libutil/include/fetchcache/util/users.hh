#pragma once
///@file

#include "fetchcache/util/types.hh"

#include <sys/types.h>

#include <vector>

namespace fetchcache {

/**
 * @return the given user's home directory from /etc/passwd.
 */
Path getHomeOf(uid_t userId);

/**
 * @return $HOME or the user's home directory from /etc/passwd.
 */
Path getHome();

/**
 * @return $FETCHCACHE_CACHE_HOME or $XDG_CACHE_HOME/fetchcache or $HOME/.cache/fetchcache.
 */
Path getCacheDir();

/**
 * @return $FETCHCACHE_CONFIG_HOME or $XDG_CONFIG_HOME/fetchcache or $HOME/.config/fetchcache.
 */
Path getConfigDir();

/**
 * Return the directories to search for user configuration files
 */
std::vector<Path> getConfigDirs();

} // namespace fetchcache
