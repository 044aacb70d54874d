#include "ociauth/auth/lookup-environment.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/util/json-utils.hh"
#include "ociauth/util/logging.hh"
#include "ociauth/util/processes.hh"
#include "ociauth/util/strings.hh"

#include <sys/wait.h>

namespace ociauth {

bool validDockerCredentialHelperName(std::string_view name)
{
    return !name.empty() && name.find('/') == name.npos && name.find('\\') == name.npos;
}

DockerCredentialHelperGetResult
parseDockerCredentialHelperOutput(const std::string & helperName, const std::string & serverURL, std::string_view output)
{
    auto json = nlohmann::json::parse(std::string(output), nullptr, false);
    if (json.is_discarded())
        throw CredentialHelperError(helperName, serverURL, "helper returned invalid JSON");

    try {
        auto & obj = getObject(json);
        DockerCredentialHelperGetResult result;
        if (auto * p = nullableValueAt(obj, "ServerURL"))
            result.serverURL = getString(*p);
        if (result.serverURL.empty())
            result.serverURL = serverURL;
        result.username = getString(valueAt(obj, "Username"));
        result.secret = getString(valueAt(obj, "Secret"));
        return result;
    } catch (Error & e) {
        throw CredentialHelperError(helperName, serverURL, "helper returned unexpected output: %s", e.message());
    }
}

DockerCredentialHelperGetResult
ExecCredentialsLookupEnvironment::queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL)
{
    if (!validDockerCredentialHelperName(helperName))
        throw CredentialHelperError(helperName, serverURL, "invalid credential helper name");

    auto program = "docker-credential-" + helperName;
    debug("running '%s get' for '%s'", program, serverURL);

    auto [status, output] = runProgram(
        RunOptions{
            .program = program,
            .lookupPath = true,
            .args = {"get"},
            .input = serverURL,
        });

    if (!statusOk(status)) {
        auto message = trim(output);
        /* The helper protocol reports "no credentials" as exit status 1
           with a message to that effect on stdout. */
        if (WIFEXITED(status) && WEXITSTATUS(status) == 1
            && toLower(message).find("credentials not found") != std::string::npos)
            throw CredentialsNotFoundError("credential helper '%s' has no credentials for '%s'", helperName, serverURL);
        if (WIFEXITED(status) && WEXITSTATUS(status) == 127)
            throw CredentialHelperError(helperName, serverURL, "cannot run '%s'; is it installed and on PATH?", program);
        printError("credential helper '%s' %s", program, statusToString(status));
        if (message.empty())
            throw CredentialHelperError(helperName, serverURL, "'%s' %s", program, statusToString(status));
        throw CredentialHelperError(
            helperName, serverURL, "'%s' %s: %s", program, statusToString(status), message);
    }

    return parseDockerCredentialHelperOutput(helperName, serverURL, output);
}

CachingCredentialsLookupEnvironment::CachingCredentialsLookupEnvironment(
    std::shared_ptr<CredentialsLookupEnvironment> next,
    std::chrono::seconds ttl,
    std::function<Clock::time_point()> now)
    : next(std::move(next))
    , ttl(ttl)
    , now(std::move(now))
{
}

DockerCredentialHelperGetResult
CachingCredentialsLookupEnvironment::queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL)
{
    if (ttl.count() == 0)
        return next->queryDockerCredentialHelper(helperName, serverURL);

    auto key = std::make_pair(helperName, serverURL);

    {
        auto state_(state.lock());
        auto i = state_->entries.find(key);
        if (i != state_->entries.end()) {
            if (now() < i->second.expiry) {
                vomit("using cached result of credential helper '%s' for '%s'", helperName, serverURL);
                if (i->second.error)
                    std::rethrow_exception(i->second.error);
                return *i->second.result;
            }
            state_->entries.erase(i);
        }
    }

    /* The lock isn't held while the helper runs, so concurrent
       lookups of the same key may both run it. */
    Entry entry;
    try {
        entry.result = next->queryDockerCredentialHelper(helperName, serverURL);
    } catch (Error &) {
        entry.error = std::current_exception();
    }
    auto inserted = now();
    entry.expiry = inserted + ttl;

    {
        auto state_(state.lock());
        /* Drop whatever has expired in the meantime, so that the cache
           doesn't grow without bound in a long-running process. */
        std::erase_if(state_->entries, [&](auto & e) { return !(inserted < e.second.expiry); });
        state_->entries.insert_or_assign(key, entry);
    }

    if (entry.error)
        std::rethrow_exception(entry.error);
    return *entry.result;
}

size_t CachingCredentialsLookupEnvironment::size()
{
    return state.lock()->entries.size();
}

} // namespace ociauth
