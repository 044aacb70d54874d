#pragma once
///@file

#include "ociauth/util/sync.hh"
#include "ociauth/util/types.hh"

#include <chrono>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ociauth {

/**
 * The response of a Docker-style credential helper's `get` command.
 */
struct DockerCredentialHelperGetResult
{
    std::string serverURL;
    std::string username;
    std::string secret;

    bool operator==(const DockerCredentialHelperGetResult &) const = default;
};

/**
 * The operations needed to turn a credentials source into concrete
 * credentials. Abstracted so that tests need not run real programs.
 */
class CredentialsLookupEnvironment
{
public:
    virtual ~CredentialsLookupEnvironment() {}

    /**
     * Ask the Docker-style credential helper `helperName` for the
     * credentials it holds for `serverURL`.
     *
     * @throws CredentialsNotFoundError if the helper ran successfully
     * but has nothing for `serverURL`.
     *
     * @throws Error (usually `CredentialHelperError`) for any other
     * failure.
     */
    virtual DockerCredentialHelperGetResult
    queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL) = 0;
};

/**
 * Whether `name` could be the suffix of a `docker-credential-<name>`
 * executable: non-empty and free of path separators.
 */
bool validDockerCredentialHelperName(std::string_view name);

/**
 * Runs `docker-credential-<helper> get` from `PATH`, passing the server
 * URL on standard input.
 */
class ExecCredentialsLookupEnvironment : public CredentialsLookupEnvironment
{
public:
    DockerCredentialHelperGetResult
    queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL) override;
};

/**
 * Decode the JSON a credential helper's `get` command prints. A missing
 * `ServerURL` defaults to `serverURL`.
 *
 * @throws CredentialHelperError if the output is malformed.
 */
DockerCredentialHelperGetResult
parseDockerCredentialHelperOutput(const std::string & helperName, const std::string & serverURL, std::string_view output);

/**
 * Memoizes the results of another lookup environment, including
 * "not found" and failure outcomes, per (helper, server URL) pair.
 *
 * Safe to use from several threads at once, provided the wrapped
 * environment is.
 */
class CachingCredentialsLookupEnvironment : public CredentialsLookupEnvironment
{
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param ttl How long an outcome is remembered. Zero disables
     * caching altogether.
     *
     * @param now Overridable for testing.
     */
    CachingCredentialsLookupEnvironment(
        std::shared_ptr<CredentialsLookupEnvironment> next,
        std::chrono::seconds ttl = std::chrono::minutes(5),
        std::function<Clock::time_point()> now = Clock::now);

    DockerCredentialHelperGetResult
    queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL) override;

    /**
     * The number of remembered outcomes. Expired ones are only dropped
     * when a new outcome is recorded.
     */
    size_t size();

private:

    std::shared_ptr<CredentialsLookupEnvironment> next;
    std::chrono::seconds ttl;
    std::function<Clock::time_point()> now;

    struct Entry
    {
        Clock::time_point expiry;
        std::optional<DockerCredentialHelperGetResult> result;
        std::exception_ptr error;
    };

    struct State
    {
        std::map<std::pair<std::string, std::string>, Entry> entries;
    };

    Sync<State> state;
};

} // namespace ociauth
