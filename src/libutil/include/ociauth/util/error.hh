#pragma once
/**
 * @file
 *
 * @brief The ociauth error hierarchy.
 *
 * ErrorInfo provides a standard payload of error information, with conversion to string
 * happening in the logger rather than at the call site.
 *
 * BaseError is the ancestor of all ociauth exceptions, and contains an ErrorInfo.
 */

#include "ociauth/util/fmt.hh"

#include <cstring>
#include <exception>
#include <optional>
#include <utility>
#include <vector>

namespace ociauth {

typedef enum { lvlError = 0, lvlWarn, lvlNotice, lvlInfo, lvlTalkative, lvlChatty, lvlDebug, lvlVomit } Verbosity;

struct ErrorInfo
{
    Verbosity level;
    HintFmt msg;

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

    void withExitStatus(unsigned int status)
    {
        err.status = status;
    }

    /**
     * Prefix the message with some context, in the manner of
     * `"reading %s: " + message()`.
     */
    template<typename... Args>
    void addPrefix(const std::string & fs, const Args &... args)
    {
        err.msg = HintFmt("%1%%2%", Uncolored(fmt(fs, args...)), Uncolored(err.msg.str()));
        what_.reset();
    }
};

#define MakeError(newClass, superClass) \
    class newClass : public superClass  \
    {                                   \
    public:                             \
        using superClass::superClass;   \
    }

MakeError(Error, BaseError);
MakeError(UsageError, Error);
MakeError(FormatError, Error);

/**
 * To use in catch-blocks.
 */
MakeError(SystemError, Error);

/**
 * POSIX system error, created using `errno`, `strerror` friends.
 *
 * Callers that need to tell "does not exist" apart from other failures
 * catch this and look at `errNo`.
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
 * Several independent errors reported together.
 *
 * Used where processing continues past a failure so that the remaining
 * inputs still get a chance, and all of the problems are reported at the
 * end. The message has one line per contained error.
 */
class JoinedError : public Error
{
    std::vector<std::exception_ptr> errors;

public:
    explicit JoinedError(std::vector<std::exception_ptr> errors);

    const std::vector<std::exception_ptr> & getErrors() const
    {
        return errors;
    }

    /**
     * Whether any of the contained errors (looking through nested
     * `JoinedError`s) is of type `E`.
     */
    template<typename E>
    bool contains() const
    {
        for (auto & e : errors) {
            try {
                std::rethrow_exception(e);
            } catch (const E &) {
                return true;
            } catch (const JoinedError & joined) {
                if (joined.contains<E>())
                    return true;
            } catch (const std::exception &) {
            }
        }
        return false;
    }
};

/**
 * Append `e` to `errors`, returning nothing. Convenience for building up
 * the argument of a `JoinedError`.
 */
template<typename E>
void appendError(std::vector<std::exception_ptr> & errors, E && e)
{
    errors.push_back(std::make_exception_ptr(std::forward<E>(e)));
}

/**
 * Throw the accumulated errors, if there are any: a lone error is
 * rethrown as-is, several are thrown as a `JoinedError`.
 */
void throwJoinedErrors(std::vector<std::exception_ptr> errors);

/**
 * The message of the exception held by `e`, without any "error: "
 * prefix.
 */
std::string exceptionMessage(const std::exception_ptr & e);

} // namespace ociauth
