#include "fetchcache/main/shared.hh"
#include "fetchcache/util/ansicolor.hh"
#include "fetchcache/util/config-global.hh"
#include "fetchcache/util/environment-variables.hh"
#include "fetchcache/util/file-system.hh"
#include "fetchcache/util/logging.hh"
#include "fetchcache/util/strings.hh"
#include "fetchcache/util/users.hh"

#include <algorithm>
#include <cctype>
#include <iostream>

#include <signal.h>
#include <unistd.h>

namespace fetchcache {

Exit::~Exit() {}

std::vector<Path> getUserConfigFiles()
{
    // Use the paths specified in FETCHCACHE_USER_CONF_FILES if it has been defined
    auto confFiles = getEnv("FETCHCACHE_USER_CONF_FILES");
    if (confFiles.has_value())
        return tokenizeString<std::vector<std::string>>(confFiles.value(), ":");

    // Use the paths specified by the XDG spec
    std::vector<Path> files;
    for (auto & dir : getConfigDirs())
        files.push_back(dir + "/fetchcache.conf");
    return files;
}

void loadConfFile(AbstractConfig & config)
{
    auto applyConfigFile = [&](const Path & path) {
        if (!pathExists(path))
            return;
        debug("loading configuration from '%s'", path);
        config.applyConfig(readFile(path), path);
    };

    auto files = getUserConfigFiles();
    for (auto file = files.rbegin(); file != files.rend(); file++)
        applyConfigFile(*file);

    auto confEnv = getEnv("FETCHCACHE_CONFIG");
    if (confEnv.has_value())
        config.applyConfig(confEnv.value(), "FETCHCACHE_CONFIG");
}

void initFetchcache(bool loadConfig)
{
    if (loadConfig)
        loadConfFile(globalConfig);

    /* Transfers report a closed connection as an error instead of
       killing the process. */
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;
    act.sa_handler = SIG_IGN;
    if (sigaction(SIGPIPE, &act, 0))
        throw SysError("ignoring SIGPIPE");
}

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

static Strings argvToStrings(int argc, char ** argv)
{
    Strings args;
    argc--;
    argv++;
    while (argc--)
        args.push_back(*argv++);
    return args;
}

/**
 * Handle the flags every invocation understands. Returns false if `arg`
 * is not one of them.
 */
static bool parseCommonArg(Strings::iterator & arg, const Strings::iterator & end)
{
    if (*arg == "-v" || *arg == "--verbose")
        verbosity = (Verbosity) std::min<std::underlying_type_t<Verbosity>>(verbosity + 1, lvlVomit);
    else if (*arg == "-q" || *arg == "--quiet")
        verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
    else if (*arg == "--debug")
        verbosity = lvlDebug;
    else if (*arg == "--option") {
        auto name = getArg(*arg, arg, end);
        auto value = getArg("--option", arg, end);
        globalConfig.set(name, value);
    } else if (*arg == "--log-format") {
        auto format = getArg(*arg, arg, end);
        if (format == "raw")
            logger = makeSimpleLogger();
        else if (format == "json")
            logger = makeJSONLogger(STDERR_FILENO);
        else
            throw UsageError("unknown log format '%s'", format);
    } else
        return false;
    return true;
}

void parseCmdLine(int argc, char ** argv, ParseArg parseArg)
{
    parseCmdLine(std::string(baseNameOf(argv[0])), argvToStrings(argc, argv), parseArg);
}

void parseCmdLine(const std::string & programName, const Strings & _args, ParseArg parseArg)
{
    Strings args(_args);

    /* Expand compound dash options (i.e., `-vvq' -> `-v -v -q'). */
    for (auto i = args.begin(); i != args.end();) {
        auto arg = *i;
        if (arg.length() > 2 && arg[0] == '-' && arg[1] != '-' && isalpha(arg[1])) {
            for (size_t j = 1; j < arg.length(); j++)
                args.insert(i, std::string("-") + arg[j]);
            i = args.erase(i);
        } else
            i++;
    }

    auto end = args.end();
    for (auto pos = args.begin(); pos != end; ++pos) {
        if (parseArg(pos, end))
            continue;
        if (parseCommonArg(pos, end))
            continue;
        if (!pos->empty() && pos->front() == '-')
            throw UsageError("unrecognised flag '%1%'", *pos);
        throw UsageError("unexpected argument '%1%'", *pos);
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% (fetchcache) %2%", programName, FETCHCACHE_VERSION) << std::endl;
    if (verbosity > lvlInfo) {
        std::cout << "User configuration files: " << concatStringsSep(":", getUserConfigFiles()) << "\n";
        std::cout << "Cache directory: " << getCacheDir() << "\n";
    }
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = baseNameOf(programName);

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace fetchcache
