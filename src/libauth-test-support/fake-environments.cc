#include "ociauth/auth/tests/fake-environments.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/util/util.hh"

#include <cerrno>

namespace ociauth {

std::string FakeConfigDiscoveryEnvironment::environmentVariableVal(const std::string & name) const
{
    auto * val = get(envVars, name);
    return val ? *val : "";
}

Path FakeConfigDiscoveryEnvironment::userHomeDirPath() const
{
    return homePath;
}

std::string FakeConfigDiscoveryEnvironment::operatingSystemName() const
{
    return osName;
}

std::string FakeConfigDiscoveryEnvironment::readFile(const Path & path) const
{
    if (unreadable.contains(path))
        throw SysError(EACCES, "opening file '%1%'", path);
    auto * contents = get(files, path);
    if (!contents)
        throw SysError(ENOENT, "opening file '%1%'", path);
    return *contents;
}

DockerCredentialHelperGetResult
FakeCredentialsLookupEnvironment::queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL)
{
    queries.emplace_back(helperName, serverURL);
    if (auto * results = get(helperResults, helperName))
        if (auto * result = get(*results, serverURL))
            return *result;
    throw CredentialsNotFoundError("fake credential helper '%s' has no credentials for '%s'", helperName, serverURL);
}

} // namespace ociauth
