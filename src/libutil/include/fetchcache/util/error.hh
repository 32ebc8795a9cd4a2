#pragma once
/**
 * @file
 *
 * @brief This file defines the two main structs/classes used in error handling.
 *
 * ErrorInfo provides a standard payload of error information, with conversion to string
 * happening in the logger rather than at the call site.
 *
 * BaseError is the ancestor of all fetchcache exceptions, and contains an ErrorInfo.
 *
 * ErrorInfo structs are sent to the logger as part of an exception, or directly with the
 * logError or logWarning macros.
 */

#include "fetchcache/util/fmt.hh"

#include <cstring>
#include <list>
#include <memory>
#include <optional>
#include <string_view>
#include <utility>

namespace fetchcache {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

/**
 * A line of context, printed below the error message.
 */
struct Trace
{
    HintFmt hint;
};

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;
    std::list<Trace> traces;

    /**
     * Exit status.
     */
    unsigned int status = 1;

    static std::optional<std::string> programName;
};

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo);

/**
 * BaseError should generally not be caught. Catch Error instead.
 */
class BaseError : public std::exception
{
protected:
    mutable ErrorInfo err;

    /**
     * Cached formatted contents of `err.msg`.
     */
    mutable std::optional<std::string> what_;
    /**
     * Format `err.msg` and set `what_` to the resulting value.
     */
    const std::string & calcWhat() const;

public:
    BaseError(const BaseError &) = default;
    BaseError & operator=(const BaseError &) = default;
    BaseError & operator=(BaseError &&) = default;

    template<typename... Args>
    BaseError(unsigned int status, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(args...), .status = status}
    {
    }

    template<typename... Args>
    explicit BaseError(const std::string & fs, const Args &... args)
        : err{.level = lvlError, .msg = HintFmt(fs, args...)}
    {
    }

    BaseError(HintFmt hint)
        : err{.level = lvlError, .msg = hint}
    {
    }

    BaseError(ErrorInfo && e)
        : err(std::move(e))
    {
    }

    BaseError(const ErrorInfo & e)
        : err(e)
    {
    }

    /** The error message without "error: " prefixed to it. */
    std::string message() const
    {
        return err.msg.str();
    }

    const char * what() const noexcept override
    {
        return calcWhat().c_str();
    }

    const std::string & msg() const
    {
        return calcWhat();
    }

    const ErrorInfo & info() const
    {
        calcWhat();
        return err;
    }

    /**
     * Prepends an item to the error trace, as is usual for extra context.
     *
     * @param fs Format string, see `HintFmt`
     * @param args... Format string arguments.
     */
    template<typename... Args>
    void addTrace(std::string_view fs, const Args &... args)
    {
        addTrace(HintFmt(std::string(fs), args...));
    }

    void addTrace(HintFmt hint);
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);

/**
 * To use in catch-blocks.
 */
MakeError(SystemError, Error);

/**
 * POSIX system error, created using `errno`, `strerror` friends.
 *
 * Throw this, but prefer not to catch this, and catch `SystemError`
 * instead.
 */
class SysError : public SystemError
{
public:
    int errNo;

    /**
     * Construct using the explicitly-provided error number. `strerror`
     * will be used to try to add additional information to the message.
     */
    template<typename... Args>
    SysError(int errNo, const Args &... args)
        : SystemError("")
        , errNo(errNo)
    {
        auto hf = HintFmt(args...);
        err.msg = HintFmt("%1%: %2%", Uncolored(hf.str()), strerror(errNo));
    }

    /**
     * Construct using the ambient `errno`.
     *
     * Be sure to not perform another `errno`-modifying operation before
     * calling this constructor!
     */
    template<typename... Args>
    SysError(const Args &... args)
        : SysError(errno, args...)
    {
    }
};

/**
 * Print a message and std::terminate().
 */
[[noreturn]]
void panic(std::string_view msg);

} // namespace fetchcache
