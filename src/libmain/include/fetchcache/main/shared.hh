#pragma once
///@file

#include "fetchcache/util/configuration.hh"
#include "fetchcache/util/error.hh"
#include "fetchcache/util/types.hh"

#include <exception>
#include <functional>

namespace fetchcache {

/**
 * Exit the program with a given exit code.
 */
class Exit : public std::exception
{
public:
    int status = 0;

    Exit() = default;

    explicit Exit(int status)
        : status(status)
    {
    }

    virtual ~Exit();
};

int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * @param loadConfig Whether to load configuration from
 * `fetchcache.conf`, `FETCHCACHE_CONFIG`, etc. May be disabled for unit
 * tests.
 */
void initFetchcache(bool loadConfig = true);

/**
 * Apply the user configuration files and then `FETCHCACHE_CONFIG` to
 * `config`. Files that cannot be read are skipped.
 */
void loadConfFile(AbstractConfig & config);

/**
 * The user configuration files, in order of decreasing precedence.
 * `FETCHCACHE_USER_CONF_FILES` overrides the default of
 * `fetchcache.conf` in each configuration directory.
 */
std::vector<Path> getUserConfigFiles();

using ParseArg = std::function<bool(Strings::iterator & arg, const Strings::iterator & end)>;

/**
 * Run `parseArg` over the command line. Compound short flags (`-vvq`)
 * are split, and the flags common to every invocation (verbosity,
 * `--option`, `--log-format`) are handled here. `parseArg` returns
 * false for arguments it does not recognise.
 */
void parseCmdLine(int argc, char ** argv, ParseArg parseArg);

void parseCmdLine(const std::string & programName, const Strings & args, ParseArg parseArg);

/**
 * Print the version and throw `Exit`.
 */
void printVersion(const std::string & programName);

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

} // namespace fetchcache
