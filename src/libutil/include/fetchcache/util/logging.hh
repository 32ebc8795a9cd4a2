#pragma once
///@file

#include "fetchcache/util/error.hh"
#include "fetchcache/util/file-descriptor.hh"

#include <memory>
#include <vector>

namespace fetchcache {

enum ActivityType {
    actUnknown = 0,
    actFileTransfer = 101,
    actVerifyFile = 107,
    actFetchCatalog = 112,
};

enum ResultType {
    resProgress = 105,
};

typedef uint64_t ActivityId;

class Logger
{
    friend struct Activity;

public:

    struct Field
    {
        // FIXME: use std::variant.
        enum { tInt = 0, tString = 1 } type;
        uint64_t i = 0;
        std::string s;

        Field(const std::string & s)
            : type(tString)
            , s(s)
        {
        }

        Field(const char * s)
            : type(tString)
            , s(s)
        {
        }

        Field(const uint64_t & i)
            : type(tInt)
            , i(i)
        {
        }
    };

    typedef std::vector<Field> Fields;

    virtual ~Logger() {}

    virtual void stop() {};

    virtual void log(Verbosity lvl, std::string_view s) = 0;

    void log(std::string_view s)
    {
        log(lvlInfo, s);
    }

    virtual void logEI(const ErrorInfo & ei) = 0;

    void logEI(Verbosity lvl, ErrorInfo ei)
    {
        ei.level = lvl;
        logEI(ei);
    }

    virtual void warn(const std::string & msg);

    virtual void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) {};

    virtual void stopActivity(ActivityId act) {};

    virtual void result(ActivityId act, ResultType type, const Fields & fields) {};

    virtual void writeToStdout(std::string_view s);

    template<typename... Args>
    inline void cout(const Args &... args)
    {
        writeToStdout(fmt(args...));
    }
};

/**
 * A variadic template that does nothing.
 *
 * Useful to call a function with each argument in a parameter pack.
 */
struct nop
{
    template<typename... T>
    nop(T...)
    {
    }
};

ActivityId getCurActivity();
void setCurActivity(const ActivityId activityId);

struct Activity
{
    Logger & logger;

    const ActivityId id;

    Activity(
        Logger & logger,
        Verbosity lvl,
        ActivityType type,
        const std::string & s = "",
        const Logger::Fields & fields = {},
        ActivityId parent = getCurActivity());

    Activity(
        Logger & logger, ActivityType type, const Logger::Fields & fields = {}, ActivityId parent = getCurActivity())
        : Activity(logger, lvlError, type, "", fields, parent) {};

    Activity(const Activity & act) = delete;

    ~Activity();

    void progress(uint64_t done = 0, uint64_t expected = 0, uint64_t running = 0, uint64_t failed = 0) const
    {
        result(resProgress, done, expected, running, failed);
    }

    template<typename... Args>
    void result(ResultType type, const Args &... args) const
    {
        Logger::Fields fields;
        nop{(fields.emplace_back(Logger::Field(args)), 1)...};
        result(type, fields);
    }

    void result(ResultType type, const Logger::Fields & fields) const
    {
        logger.result(id, type, fields);
    }

    friend class Logger;
};

struct PushActivity
{
    const ActivityId prevAct;

    PushActivity(ActivityId act)
        : prevAct(getCurActivity())
    {
        setCurActivity(act);
    }

    ~PushActivity()
    {
        setCurActivity(prevAct);
    }
};

extern std::unique_ptr<Logger> logger;

std::unique_ptr<Logger> makeSimpleLogger();

/**
 * A logger that writes one JSON record per line to `fd`, for
 * consumption by other programs.
 */
std::unique_ptr<Logger> makeJSONLogger(Descriptor fd);

/**
 * suppress msgs > this
 */
extern Verbosity verbosity;

/**
 * Print a message with the standard ErrorInfo format.
 * In general, use these 'log' macros for reporting problems that may require user
 * intervention or that need more explanation.  Use the 'print' macros for more
 * lightweight status messages.
 */
#define logErrorInfo(level, errorInfo...)                  \
    do {                                                   \
        if ((level) <= fetchcache::verbosity) {            \
            fetchcache::logger->logEI((level), errorInfo); \
        }                                                  \
    } while (0)

#define logError(errorInfo...) logErrorInfo(fetchcache::lvlError, errorInfo)
#define logWarning(errorInfo...) logErrorInfo(fetchcache::lvlWarn, errorInfo)

/**
 * Print a string message if the current log level is at least the specified
 * level. Note that this has to be implemented as a macro to ensure that the
 * arguments are evaluated lazily.
 */
#define printMsgUsing(loggerParam, level, args...)          \
    do {                                                    \
        auto __lvl = level;                                 \
        if (__lvl <= fetchcache::verbosity) {               \
            loggerParam->log(__lvl, fetchcache::fmt(args)); \
        }                                                   \
    } while (0)
#define printMsg(level, args...) printMsgUsing(fetchcache::logger, level, args)

#define printError(args...) printMsg(fetchcache::lvlError, args)
#define notice(args...) printMsg(fetchcache::lvlNotice, args)
#define printInfo(args...) printMsg(fetchcache::lvlInfo, args)
#define printTalkative(args...) printMsg(fetchcache::lvlTalkative, args)
#define debug(args...) printMsg(fetchcache::lvlDebug, args)
#define vomit(args...) printMsg(fetchcache::lvlVomit, args)

/**
 * if verbosity >= lvlWarn, print a message with a yellow 'warning:' prefix.
 */
template<typename... Args>
inline void warn(const std::string & fs, const Args &... args)
{
    boost::format f(fs);
    formatHelper(f, args...);
    logger->warn(f.str());
}

void writeToStderr(std::string_view s);

} // namespace fetchcache
