#pragma once
///@file

#include "ociauth/auth/discovery-environment.hh"
#include "ociauth/auth/lookup-environment.hh"

#include <gmock/gmock.h>

#include <map>

namespace ociauth {

/**
 * A discovery environment whose operating system, home directory,
 * environment variables and files are all given up front. Nothing
 * touches the real host.
 */
struct FakeConfigDiscoveryEnvironment : ConfigDiscoveryEnvironment
{
    std::string osName = "linux";
    Path homePath = "/home/example";
    StringMap envVars;

    /**
     * Path to contents. Paths not listed here do not exist.
     */
    std::map<Path, std::string> files;

    /**
     * Paths whose reading fails with `EACCES`.
     */
    StringSet unreadable;

    std::string environmentVariableVal(const std::string & name) const override;
    Path userHomeDirPath() const override;
    std::string operatingSystemName() const override;
    std::string readFile(const Path & path) const override;
};

/**
 * A lookup environment with canned credential helper answers: helper
 * name to server URL to result. Anything else is "not found".
 */
struct FakeCredentialsLookupEnvironment : CredentialsLookupEnvironment
{
    std::map<std::string, std::map<std::string, DockerCredentialHelperGetResult>> helperResults;

    /**
     * Each query, as (helper name, server URL), in order.
     */
    std::vector<std::pair<std::string, std::string>> queries;

    DockerCredentialHelperGetResult
    queryDockerCredentialHelper(const std::string & helperName, const std::string & serverURL) override;
};

class MockCredentialsLookupEnvironment : public CredentialsLookupEnvironment
{
public:
    MOCK_METHOD(
        DockerCredentialHelperGetResult,
        queryDockerCredentialHelper,
        (const std::string & helperName, const std::string & serverURL),
        (override));
};

} // namespace ociauth
