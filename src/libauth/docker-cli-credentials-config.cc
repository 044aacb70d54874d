#include "ociauth/auth/docker-cli-credentials-config.hh"
#include "ociauth/auth/repository-address.hh"
#include "ociauth/util/base-n.hh"
#include "ociauth/util/file-system.hh"
#include "ociauth/util/json-utils.hh"
#include "ociauth/util/logging.hh"
#include "ociauth/util/strings.hh"
#include "ociauth/util/util.hh"

#include <algorithm>
#include <cerrno>

namespace ociauth {

CredentialsSpecificity containersAuthPropertyNameMatch(
    std::string_view authsPropertyName, std::string_view wantRegistryDomain, std::string_view wantRepositoryPath)
{
    if (authsPropertyName.empty())
        return CredentialsSpecificity::none();

    std::string gotDomain, gotRepositoryPath;
    if (authsPropertyName.find('/') != authsPropertyName.npos) {
        try {
            auto addr = parseRepositoryAddressPrefix(authsPropertyName);
            gotDomain = std::move(addr.registryDomain);
            gotRepositoryPath = std::move(addr.repositoryPath);
        } catch (BadRepositoryAddress & e) {
            vomit("ignoring credentials entry '%s': %s", authsPropertyName, e.message());
            return CredentialsSpecificity::none();
        }
    } else
        gotDomain = authsPropertyName;

    if (gotDomain != wantRegistryDomain)
        return CredentialsSpecificity::none();
    if (gotRepositoryPath.empty())
        return CredentialsSpecificity::domain();

    /* Every segment of the configured path must equal the corresponding
       leading segment of the wanted path. */
    auto want = splitString<std::vector<std::string>>(wantRepositoryPath, "/");
    auto got = splitString<std::vector<std::string>>(gotRepositoryPath, "/");
    if (got.size() > want.size())
        return CredentialsSpecificity::none();
    if (!std::equal(got.begin(), got.end(), want.begin()))
        return CredentialsSpecificity::none();

    return CredentialsSpecificity::repository(static_cast<unsigned int>(got.size()));
}

DockerCLIStyleCredentialsConfig::DockerCLIStyleCredentialsConfig(std::string_view contents, Path filename_)
    : filename(std::move(filename_))
{
    auto json = nlohmann::json::parse(std::string(contents), nullptr, false);
    if (json.is_discarded())
        throw Error("invalid JSON syntax");

    auto & obj = getObject(json);

    if (auto * authsJson = nullableValueAt(obj, "auths")) {
        for (auto & [propName, authJson] : getObject(*authsJson)) {
            /* Some tools write null or empty entries on login when the
               actual secret went to a credential helper. */
            if (authJson.is_null())
                continue;
            auto * auth = nullableValueAt(getObject(authJson), "auth");
            if (!auth)
                continue;
            auto & encoded = getString(*auth);
            if (encoded.empty())
                continue;
            auths.emplace(propName, encoded);
        }
    }

    if (auto * credHelpersJson = nullableValueAt(obj, "credHelpers"))
        for (auto & [domain, helperJson] : getObject(*credHelpersJson)) {
            if (helperJson.is_null())
                continue;
            auto & helperName = getString(helperJson);
            if (!helperName.empty())
                credHelpers.emplace(domain, helperName);
        }

    if (auto * credsStoreJson = nullableValueAt(obj, "credsStore")) {
        auto & helperName = getString(*credsStoreJson);
        if (!helperName.empty())
            credsStore = helperName;
    }
}

void DockerCLIStyleCredentialsConfig::credentialsSourcesForRepository(
    std::string_view registryDomain, std::string_view repositoryPath, const CredentialsSourceSink & sink) const
{
    for (auto & [propName, encoded] : auths) {
        auto specificity = containersAuthPropertyNameMatch(propName, registryDomain, repositoryPath);
        if (!specificity)
            continue;

        std::string decoded;
        try {
            decoded = base64::decode(encoded);
        } catch (FormatError & e) {
            warn("ignoring auth object for '%s' in '%s': %s", propName, filename, e.message());
            continue;
        }

        auto userPass = splitPrefixTo(decoded, ':');
        if (!userPass) {
            warn(
                "ignoring auth object for '%s' in '%s': it does not contain a base64-encoded username:password pair",
                propName,
                filename);
            continue;
        }

        if (!sink(
                {.source = StaticCredentialsSource{
                     .credentials = Credentials::basicAuth(std::string(userPass->first), std::string(userPass->second)),
                     .specificity = specificity,
                 }}))
            return;
    }

    auto serverURL = "https://" + std::string(registryDomain);

    if (auto * helperName = get(credHelpers, registryDomain); helperName && !helperName->empty()) {
        if (!sink(
                {.source = DockerCredentialHelperCredentialsSource{
                     .helperName = *helperName,
                     .serverURL = serverURL,
                     .specificity = CredentialsSpecificity::domain(),
                 }}))
            return;
    }

    if (credsStore)
        sink(
            {.source = DockerCredentialHelperCredentialsSource{
                 .helperName = *credsStore,
                 .serverURL = serverURL,
                 .specificity = CredentialsSpecificity::global(),
             }});
}

std::string DockerCLIStyleCredentialsConfig::locationForUI() const
{
    return filename;
}

Paths dockerCLIStyleAuthFileSearchLocations(const ConfigDiscoveryEnvironment & env)
{
    auto os = env.operatingSystemName();
    auto homeDir = env.userHomeDirPath();
    Paths res;

    if (os == "linux") {
        auto xdgRuntimeDir = env.environmentVariableVal("XDG_RUNTIME_DIR");
        if (!xdgRuntimeDir.empty())
            res.push_back(joinPath(joinPath(xdgRuntimeDir, "containers"), "auth.json"));
    } else if (os == "windows" || os == "darwin")
        res.push_back(joinPath(joinPath(joinPath(homeDir, ".config"), "containers"), "auth.json"));

    auto xdgConfigHome = env.environmentVariableVal("XDG_CONFIG_HOME");
    if (xdgConfigHome.empty())
        xdgConfigHome = joinPath(homeDir, ".config");
    /* On Windows and macOS this may repeat the first entry. */
    res.push_back(joinPath(joinPath(xdgConfigHome, "containers"), "auth.json"));

    res.push_back(joinPath(joinPath(homeDir, ".docker"), "config.json"));
    res.push_back(joinPath(homeDir, ".dockercfg"));
    return res;
}

/**
 * Read and parse one file, recording any problem in `errors`.
 *
 * @param skipMissing Whether a nonexistent file is silently skipped
 * rather than being an error.
 */
static void loadDockerCLIStyleCredentialsConfig(
    const Path & filePath,
    const ConfigDiscoveryEnvironment & env,
    bool skipMissing,
    std::vector<ref<const CredentialsConfig>> & configs,
    std::vector<std::exception_ptr> & errors)
{
    std::string contents;
    try {
        contents = env.readFile(filePath);
    } catch (SysError & e) {
        if (skipMissing && e.errNo == ENOENT) {
            vomit("'%s' does not exist", filePath);
            return;
        }
        e.addPrefix("reading %s: ", filePath);
        appendError(errors, e);
        return;
    } catch (Error & e) {
        e.addPrefix("reading %s: ", filePath);
        appendError(errors, e);
        return;
    }

    try {
        configs.push_back(make_ref<DockerCLIStyleCredentialsConfig>(contents, filePath));
        debug("loaded Docker-style credentials configuration from '%s'", filePath);
    } catch (Error & e) {
        e.addPrefix("parsing %s: ", filePath);
        appendError(errors, e);
    }
}

std::vector<ref<const CredentialsConfig>> findDockerCLIStyleCredentialsConfigs(const ConfigDiscoveryEnvironment & env)
{
    std::vector<ref<const CredentialsConfig>> configs;
    std::vector<std::exception_ptr> errors;

    Path prevPath;
    for (auto & filePath : dockerCLIStyleAuthFileSearchLocations(env)) {
        if (filePath == prevPath)
            continue;
        prevPath = filePath;
        loadDockerCLIStyleCredentialsConfig(filePath, env, true, configs, errors);
    }

    throwJoinedErrors(std::move(errors));
    return configs;
}

std::vector<ref<const CredentialsConfig>>
fixedDockerCLIStyleCredentialsConfigs(const Paths & filePaths, const ConfigDiscoveryEnvironment & env)
{
    std::vector<ref<const CredentialsConfig>> configs;
    std::vector<std::exception_ptr> errors;

    for (auto & filePath : filePaths)
        loadDockerCLIStyleCredentialsConfig(filePath, env, false, configs, errors);

    throwJoinedErrors(std::move(errors));
    return configs;
}

} // namespace ociauth
