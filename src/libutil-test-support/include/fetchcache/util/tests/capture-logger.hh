#pragma once
///@file

#include "fetchcache/util/logging.hh"
#include "fetchcache/util/terminal.hh"

#include <sstream>

namespace fetchcache::testing {

/**
 * A logger that records everything instead of printing it.
 */
class CaptureLogger : public Logger
{
    std::ostringstream oss;
    std::ostringstream out;

public:

    struct Progress
    {
        uint64_t done;
        uint64_t expected;
    };

    std::vector<ActivityType> activities;
    std::vector<Progress> progress;

    /**
     * Log messages, one per line, with ANSI escapes removed.
     */
    std::string get() const
    {
        return oss.str();
    }

    /**
     * Everything written with `cout()`.
     */
    std::string getStdout() const
    {
        return out.str();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        oss << filterANSIEscapes(s, true) << std::endl;
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream s;
        showErrorInfo(s, ei);
        oss << filterANSIEscapes(s.str(), true);
    }

    void startActivity(
        ActivityId act,
        Verbosity lvl,
        ActivityType type,
        const std::string & s,
        const Fields & fields,
        ActivityId parent) override
    {
        activities.push_back(type);
    }

    void result(ActivityId act, ResultType type, const Fields & fields) override
    {
        if (type == resProgress && fields.size() >= 2)
            progress.push_back({fields[0].i, fields[1].i});
    }

    void writeToStdout(std::string_view s) override
    {
        out << s << "\n";
    }
};

/**
 * Install a `CaptureLogger` for the lifetime of this object.
 */
class CaptureLogging
{
    std::unique_ptr<Logger> oldLogger;
    Verbosity oldVerbosity;

public:

    CaptureLogging(Verbosity lvl = lvlInfo)
        : oldVerbosity(verbosity)
    {
        oldLogger = std::move(logger);
        logger = std::make_unique<CaptureLogger>();
        verbosity = lvl;
    }

    ~CaptureLogging()
    {
        logger = std::move(oldLogger);
        verbosity = oldVerbosity;
    }

    CaptureLogger & get()
    {
        return dynamic_cast<CaptureLogger &>(*logger);
    }
};

} // namespace fetchcache::testing
