#include "fetchcache/util/error.hh"
#include "fetchcache/util/logging.hh"

#include <iostream>
#include <sstream>

namespace fetchcache {

void BaseError::addTrace(HintFmt hint)
{
    err.traces.push_front(Trace{.hint = hint});
    what_.reset();
}

// c++ std::exception descendants must have a 'const char* what()' function.
// This stringifies the error and caches it for use by what(), or similarly by msg().
const std::string & BaseError::calcWhat() const
{
    if (what_.has_value())
        return *what_;
    else {
        std::ostringstream oss;
        showErrorInfo(oss, err);
        what_ = oss.str();
        return *what_;
    }
}

std::optional<std::string> ErrorInfo::programName = std::nullopt;

std::ostream & operator<<(std::ostream & os, const HintFmt & hf)
{
    return os << hf.str();
}

std::ostream & showErrorInfo(std::ostream & out, const ErrorInfo & einfo)
{
    std::string prefix;
    switch (einfo.level) {
    case Verbosity::lvlError: {
        prefix = ANSI_RED "error";
        break;
    }
    case Verbosity::lvlNotice: {
        prefix = ANSI_RED "note";
        break;
    }
    case Verbosity::lvlWarn: {
        prefix = ANSI_WARNING "warning";
        break;
    }
    case Verbosity::lvlInfo: {
        prefix = ANSI_GREEN "info";
        break;
    }
    case Verbosity::lvlTalkative: {
        prefix = ANSI_GREEN "talk";
        break;
    }
    case Verbosity::lvlChatty: {
        prefix = ANSI_GREEN "chat";
        break;
    }
    case Verbosity::lvlVomit: {
        prefix = ANSI_GREEN "vomit";
        break;
    }
    case Verbosity::lvlDebug: {
        prefix = ANSI_WARNING "debug";
        break;
    }
    default:
        panic("invalid verbosity level");
    }

    prefix += ":" ANSI_NORMAL " ";

    std::ostringstream oss;

    for (auto & trace : einfo.traces)
        oss << "\n" << "… " << trace.hint.str();

    if (!einfo.traces.empty())
        oss << "\n\n" << prefix;

    oss << einfo.msg.str();

    out << (einfo.traces.empty() ? prefix : "") << oss.str();

    return out;
}

void panic(std::string_view msg)
{
    writeToStderr(ANSI_RED "HALT! " ANSI_NORMAL);
    writeToStderr(msg);
    writeToStderr("\n");
    std::terminate();
}

} // namespace fetchcache
