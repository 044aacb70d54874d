#pragma once
///@file

#include "ociauth/util/error.hh"

namespace ociauth {

/**
 * No applicable credentials: a layer has nothing for the requested
 * repository, or a credential helper reported that it has nothing for
 * the requested server.
 *
 * This is an expected outcome, for instance for public repositories, and
 * callers should test for it with `isCredentialsNotFoundError()` rather
 * than catching this type directly, because it can also arrive wrapped
 * in a `JoinedError`.
 */
MakeError(CredentialsNotFoundError, Error);

/**
 * A Docker-style credential helper could not be run, failed, or
 * produced output we could not understand.
 */
class CredentialHelperError : public Error
{
public:
    std::string helperName;
    std::string serverURL;

    template<typename... Args>
    CredentialHelperError(std::string helperName, std::string serverURL, const std::string & fs, const Args &... args)
        : Error("")
        , helperName(std::move(helperName))
        , serverURL(std::move(serverURL))
    {
        err.msg = HintFmt(
            "Docker credential helper '%s' for '%s': %s",
            this->helperName,
            this->serverURL,
            Uncolored(HintFmt(fs, args...).str()));
    }
};

/**
 * Whether `e` is, or is a `JoinedError` containing, a
 * `CredentialsNotFoundError`.
 */
bool isCredentialsNotFoundError(const std::exception_ptr & e);
bool isCredentialsNotFoundError(const std::exception & e);

} // namespace ociauth
