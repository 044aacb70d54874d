#include "ociauth/util/error.hh"
#include "ociauth/util/logging.hh"
#include "ociauth/util/strings.hh"

#include <sstream>

namespace ociauth {

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
    }

    prefix += ":" ANSI_NORMAL " ";

    out << prefix << einfo.msg.str();
    return out;
}

JoinedError::JoinedError(std::vector<std::exception_ptr> errors)
    : Error("")
    , errors(std::move(errors))
{
    std::vector<std::string> lines;
    for (auto & e : this->errors)
        lines.push_back(exceptionMessage(e));
    err.msg = HintFmt(concatStringsSep("\n", lines));
}

void throwJoinedErrors(std::vector<std::exception_ptr> errors)
{
    if (errors.empty())
        return;
    if (errors.size() == 1)
        std::rethrow_exception(errors.front());
    throw JoinedError(std::move(errors));
}

std::string exceptionMessage(const std::exception_ptr & e)
{
    try {
        std::rethrow_exception(e);
    } catch (const BaseError & err) {
        return err.message();
    } catch (const std::exception & err) {
        return err.what();
    }
}

} // namespace ociauth
