#include "ociauth/auth/credentials-config.hh"
#include "ociauth/auth/discovery-environment.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/auth/lookup-environment.hh"
#include "ociauth/auth/repository-address.hh"
#include "ociauth/cliconfig/oci-credentials.hh"
#include "ociauth/main/shared.hh"
#include "ociauth/util/environment-variables.hh"
#include "ociauth/util/exit.hh"
#include "ociauth/util/logging.hh"

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>

using namespace ociauth;
using nlohmann::json;

static const std::string usage = R"(Usage: ociauth [options] locations
       ociauth [options] lookup REPOSITORY

Show how OCI registry credentials are chosen for a repository.

Commands:
  locations             List the credentials configuration layers, most
                        important first.
  lookup REPOSITORY     Resolve the credentials for REPOSITORY, given as
                        DOMAIN/PATH, and print them as JSON.

Options:
  --config FILE         Read the CLI configuration from FILE. May be
                        repeated. Defaults to $OCIAUTH_CONFIG_FILE.
  --show-secrets        Print passwords and tokens instead of redacting them.
  -v, --verbose         Increase the logging verbosity level.
  --quiet               Decrease the logging verbosity level.
  --debug               Set the logging verbosity level to 'debug'.
  --help                Show this help.
  --version             Show the version.
)";

static std::string redact(const std::string & secret, bool showSecrets)
{
    if (showSecrets || secret.empty())
        return secret;
    return "<redacted>";
}

static json registryAuthToJSON(const RegistryAuth & auth, bool showSecrets)
{
    json res = json::object();
    if (!auth.username.empty() || !auth.password.empty()) {
        res["username"] = auth.username;
        res["password"] = redact(auth.password, showSecrets);
    }
    if (!auth.accessToken.empty() || !auth.refreshToken.empty()) {
        res["access_token"] = redact(auth.accessToken, showSecrets);
        res["refresh_token"] = redact(auth.refreshToken, showSecrets);
    }
    return res;
}

static CredentialsConfigs loadPolicy(const Paths & configFiles, const ConfigDiscoveryEnvironment & env)
{
    for (auto & file : configFiles)
        debug("reading CLI configuration from '%s'", file);
    return ociCredentialsPolicy(loadCLIConfig(configFiles), env);
}

static void cmdLocations(const CredentialsConfigs & policy)
{
    if (policy.allConfigs().empty())
        notice("no OCI registry credentials are configured");
    for (auto & config : policy.allConfigs())
        logger->cout("%s", config->locationForUI());
}

static void cmdLookup(const CredentialsConfigs & policy, const std::string & repository, bool showSecrets)
{
    auto address = parseRepositoryAddress(repository);

    try {
        auto result = policy.credentialsSourceForRepository(address.registryDomain, address.repositoryPath);

        if (result.errors)
            warn("some credentials configuration could not be used:\n%s", exceptionMessage(result.errors));

        printInfo("using %s", result.source.describe());
        printInfo("specificity: %s", result.source.specificity());
        printInfo("from: %s", result.location);

        auto lookupEnv = std::make_shared<CachingCredentialsLookupEnvironment>(
            std::make_shared<ExecCredentialsLookupEnvironment>());
        auto credentials = result.source.credentials(*lookupEnv);

        logger->cout("%s", registryAuthToJSON(credentials.toRegistryAuth(), showSecrets).dump(2));
    } catch (Error & e) {
        if (!isCredentialsNotFoundError(e))
            throw;
        notice("no credentials available for '%s'", address.to_string());
        debug("%s", e.message());
    }
}

static int main_ociauth(int argc, char ** argv)
{
    std::optional<std::string> command;
    std::optional<std::string> repository;
    Paths configFiles;
    bool showSecrets = false;

    parseCmdLine(argc, argv, [&](Strings::iterator & arg, const Strings::iterator & end) {
        if (*arg == "--help") {
            std::cout << usage;
            throw Exit();
        } else if (*arg == "--version")
            printVersion("ociauth");
        else if (*arg == "--config")
            configFiles.push_back(getArg(*arg, arg, end));
        else if (*arg == "--show-secrets")
            showSecrets = true;
        else if (arg->starts_with("-"))
            return false;
        else if (!command)
            command = *arg;
        else if (*command == "lookup" && !repository)
            repository = *arg;
        else
            return false;
        return true;
    });

    if (!command)
        throw UsageError("no command given");

    if (configFiles.empty())
        if (auto file = getEnvNonEmpty("OCIAUTH_CONFIG_FILE"))
            configFiles.push_back(*file);

    OSConfigDiscoveryEnvironment env;

    if (*command == "locations")
        cmdLocations(loadPolicy(configFiles, env));
    else if (*command == "lookup") {
        if (!repository)
            throw UsageError("'lookup' requires a repository address");
        cmdLookup(loadPolicy(configFiles, env), *repository, showSecrets);
    } else
        throw UsageError("unknown command '%s'", *command);

    return 0;
}

int main(int argc, char ** argv)
{
    return handleExceptions(argv[0], [&]() {
        initOCIAuth();
        if (auto status = main_ociauth(argc, argv))
            throw Exit(status);
    });
}
