#include "ociauth/cliconfig/oci-credentials.hh"
#include "ociauth/auth/docker-cli-credentials-config.hh"
#include "ociauth/auth/lookup-environment.hh"
#include "ociauth/auth/repository-address.hh"
#include "ociauth/util/file-system.hh"
#include "ociauth/util/json-utils.hh"
#include "ociauth/util/logging.hh"
#include "ociauth/util/strings.hh"

#include <functional>
#include <map>

namespace ociauth {

using nlohmann::json;

static const std::string invalidDefaultCredentials = "Invalid oci_default_credentials block";
static const std::string invalidRepositoryCredentials = "Invalid oci_credentials block";

CLIConfigError::CLIConfigError(Strings problems)
    : Error(HintFmt(concatStringsSep("\n", problems)))
    , problems(std::move(problems))
{
}

const OCIDefaultCredentials & defaultOCIDefaultCredentials()
{
    static const OCIDefaultCredentials defaults{
        .discoverAmbientCredentials = true,
        .dockerStyleConfigFiles = std::nullopt,
        .defaultDockerCredentialHelper = "",
        .declaredAt = "built-in defaults",
    };
    return defaults;
}

void CLIConfig::merge(const CLIConfig & other)
{
    ociDefaultCredentials.insert(
        ociDefaultCredentials.end(), other.ociDefaultCredentials.begin(), other.ociDefaultCredentials.end());
    ociRepositoryCredentials.insert(
        ociRepositoryCredentials.end(), other.ociRepositoryCredentials.begin(), other.ociRepositoryCredentials.end());
}

void CLIConfig::validate() const
{
    Strings problems;

    for (size_t i = 1; i < ociDefaultCredentials.size(); ++i)
        problems.push_back(
            fmt("No more than one oci_default_credentials block may be specified: the block at %s conflicts with the one at %s.",
                ociDefaultCredentials[i].declaredAt,
                ociDefaultCredentials[0].declaredAt));

    std::map<std::string, const OCIRepositoryCredentials *> seen;
    for (auto & block : ociRepositoryCredentials) {
        auto [i, inserted] = seen.emplace(block.repositoryPrefix, &block);
        if (!inserted)
            problems.push_back(
                fmt("Duplicate oci_credentials block for \"%s\": the block at %s uses the same repository address prefix as the one at %s.",
                    block.repositoryPrefix,
                    block.declaredAt,
                    i->second->declaredAt));
    }

    if (!problems.empty())
        throw CLIConfigError(std::move(problems));
}

/**
 * Call `f` on each block of a JSON block value: an object is one block,
 * an array is a sequence of blocks of the same type.
 */
static void forEachBlock(
    const json & value,
    const json::json_pointer & pointer,
    std::function<void(const json & body, const json::json_pointer & pointer)> f)
{
    if (value.is_array()) {
        size_t n = 0;
        for (auto & body : value)
            f(body, pointer / n++);
    } else
        f(value, pointer);
}

static std::string blockPosition(const Path & filename, const json::json_pointer & pointer)
{
    return filename + ":" + pointer.to_string();
}

static std::optional<OCIDefaultCredentials>
decodeOCIDefaultCredentialsBlockBody(const json & body, const std::string & pos, const Path & baseDir, Strings & problems)
{
    auto problem = [&](const std::string & detail) {
        problems.push_back(fmt("%s: %s", invalidDefaultCredentials, detail));
    };

    if (!body.is_object()) {
        problem(fmt("The oci_default_credentials block at %s must be represented by a JSON object.", pos));
        return std::nullopt;
    }

    auto ret = defaultOCIDefaultCredentials();
    ret.declaredAt = pos;
    std::optional<std::string> helper;

    try {
        for (auto & [name, value] : getObject(body)) {
            if (name == "discover_ambient_credentials") {
                if (!value.is_null())
                    ret.discoverAmbientCredentials = getBoolean(value);
            } else if (name == "docker_style_config_files") {
                if (value.is_null())
                    continue;
                /* An empty list means "no files", not "the default
                   locations". */
                Paths files;
                for (auto & file : getStringList(value))
                    files.push_back(absPath(file, baseDir));
                ret.dockerStyleConfigFiles = std::move(files);
            } else if (name == "docker_credentials_helper") {
                if (!value.is_null())
                    helper = getString(value);
            } else
                throw Error("unsupported argument \"%s\"", name);
        }
    } catch (Error & e) {
        problem(fmt("Invalid oci_default_credentials block at %s: %s.", pos, e.message()));
        return std::nullopt;
    }

    if (helper) {
        ret.defaultDockerCredentialHelper = *helper;
        if (!validDockerCredentialHelperName(*helper))
            problem(
                fmt("The oci_default_credentials block at %s specifies the invalid Docker credential helper name \"%s\". Must be a non-empty string that could be used as part of an executable filename.",
                    pos,
                    *helper));
    }

    if (!ret.discoverAmbientCredentials && ret.dockerStyleConfigFiles)
        problem(
            fmt("The oci_default_credentials block at %s disables discovery of ambient credentials, but also sets docker_style_config_files which is relevant only when ambient credentials discovery is enabled.",
                pos));

    return ret;
}

static std::optional<OCIRepositoryCredentials>
decodeOCICredentialsBlockBody(const std::string & label, const json & body, const std::string & pos, Strings & problems)
{
    auto problem = [&](const std::string & detail) {
        problems.push_back(fmt("%s: %s", invalidRepositoryCredentials, detail));
    };

    /* Only validated here: matching parses the label again, the same
       way it parses the property names of Docker-style files. */
    std::string repositoryPath;
    try {
        repositoryPath = parseRepositoryAddressPrefix(label).repositoryPath;
    } catch (BadRepositoryAddress & e) {
        problem(fmt("The oci_credentials block at %s has an invalid block label: %s.", pos, e.message()));
        return std::nullopt;
    }

    if (!body.is_object()) {
        problem(fmt("The oci_credentials block at %s must be represented by a JSON object.", pos));
        return std::nullopt;
    }

    std::optional<std::string> username, password, accessToken, refreshToken, helper;
    const std::map<std::string, std::optional<std::string> *, std::less<>> arguments{
        {"username", &username},
        {"password", &password},
        {"access_token", &accessToken},
        {"refresh_token", &refreshToken},
        {"docker_credentials_helper", &helper},
    };

    try {
        for (auto & [name, value] : getObject(body)) {
            auto i = arguments.find(name);
            if (i == arguments.end())
                throw Error("unsupported argument \"%s\"", name);
            if (!value.is_null())
                *i->second = getString(value);
        }
    } catch (Error & e) {
        problem(fmt("Invalid oci_credentials block at %s: %s.", pos, e.message()));
        return std::nullopt;
    }

    bool staticBasicAuth = username || password;
    bool oauth = accessToken || refreshToken;
    bool dockerCredHelper = helper.has_value();

    auto groups = int(staticBasicAuth) + int(oauth) + int(dockerCredHelper);
    if (groups == 0) {
        problem(
            fmt("The oci_credentials block at %s must set either username+password, access_token+refresh_token, or docker_credentials_helper.",
                pos));
        return std::nullopt;
    }
    if (groups > 1) {
        problem(
            fmt("The oci_credentials block at %s must set only one group out of username+password, access_token+refresh_token, or docker_credentials_helper.",
                pos));
        return std::nullopt;
    }

    OCIRepositoryCredentials ret{.repositoryPrefix = label, .declaredAt = pos};

    if (staticBasicAuth) {
        if (!username || !password) {
            problem(
                fmt("The oci_credentials block at %s must set both username and password together when using static credentials.",
                    pos));
            return std::nullopt;
        }
        ret.username = *username;
        ret.password = *password;
    } else if (oauth) {
        if (!accessToken || !refreshToken) {
            problem(
                fmt("The oci_credentials block at %s must set both access_token and refresh_token together when using OAuth-style credentials.",
                    pos));
            return std::nullopt;
        }
        ret.accessToken = *accessToken;
        ret.refreshToken = *refreshToken;
    } else {
        ret.dockerCredentialHelper = *helper;
        bool ok = true;
        if (!repositoryPath.empty()) {
            problem(
                fmt("The oci_credentials block at %s cannot set docker_credentials_helper with a repository path: credential helpers only support credentials for whole domains.",
                    pos));
            ok = false;
        }
        if (!validDockerCredentialHelperName(*helper)) {
            problem(
                fmt("The oci_credentials block at %s specifies the invalid Docker credential helper name \"%s\". Must be a non-empty string that could be used as part of an executable filename.",
                    pos,
                    *helper));
            ok = false;
        }
        if (!ok)
            return std::nullopt;
    }

    return ret;
}

CLIConfig parseCLIConfig(std::string_view contents, const Path & filename)
{
    auto root = json::parse(std::string(contents), nullptr, false);
    if (root.is_discarded())
        throw Error("CLI configuration file '%s' is not valid JSON", filename);
    if (!root.is_object())
        throw Error("CLI configuration file '%s' must contain a JSON object", filename);

    auto baseDir = dirOf(absPath(filename));

    CLIConfig config;
    Strings problems;

    auto & topLevel = getObject(root);

    if (auto * blocks = nullableValueAt(topLevel, "oci_default_credentials"))
        forEachBlock(*blocks, json::json_pointer() / "oci_default_credentials", [&](auto & body, auto & pointer) {
            if (auto block =
                    decodeOCIDefaultCredentialsBlockBody(body, blockPosition(filename, pointer), baseDir, problems))
                config.ociDefaultCredentials.push_back(std::move(*block));
        });

    if (auto * labels = nullableValueAt(topLevel, "oci_credentials")) {
        auto pointer = json::json_pointer() / "oci_credentials";
        if (!labels->is_object())
            problems.push_back(
                fmt("%s: The oci_credentials block at %s must have one label, giving an OCI repository address prefix.",
                    invalidRepositoryCredentials,
                    blockPosition(filename, pointer)));
        else
            for (auto & [label, blocks] : labels->items())
                forEachBlock(blocks, pointer / label, [&](auto & body, auto & blockPointer) {
                    if (auto block = decodeOCICredentialsBlockBody(
                            label, body, blockPosition(filename, blockPointer), problems))
                        config.ociRepositoryCredentials.push_back(std::move(*block));
                });
    }

    if (!problems.empty())
        throw CLIConfigError(std::move(problems));

    return config;
}

CLIConfig loadCLIConfigFile(const Path & path)
{
    debug("reading CLI configuration file '%s'", path);
    return parseCLIConfig(readFile(path), path);
}

CLIConfig loadCLIConfig(const Paths & paths)
{
    CLIConfig config;
    Strings problems;

    for (auto & path : paths) {
        try {
            config.merge(loadCLIConfigFile(path));
        } catch (CLIConfigError & e) {
            problems.insert(problems.end(), e.getProblems().begin(), e.getProblems().end());
        }
    }

    if (!problems.empty())
        throw CLIConfigError(std::move(problems));

    config.validate();
    return config;
}

OCIRepositoryCredentialsConfig::OCIRepositoryCredentialsConfig(OCIRepositoryCredentials block)
    : block(std::move(block))
{
}

void OCIRepositoryCredentialsConfig::credentialsSourcesForRepository(
    std::string_view registryDomain, std::string_view repositoryPath, const CredentialsSourceSink & sink) const
{
    auto specificity = containersAuthPropertyNameMatch(block.repositoryPrefix, registryDomain, repositoryPath);
    if (!specificity)
        return;

    if (!block.username.empty())
        sink({.source = StaticCredentialsSource{
                  .credentials = Credentials::basicAuth(block.username, block.password),
                  .specificity = specificity,
              }});
    else if (!block.accessToken.empty())
        sink({.source = StaticCredentialsSource{
                  .credentials = Credentials::oauth(block.accessToken, block.refreshToken),
                  .specificity = specificity,
              }});
    else if (!block.dockerCredentialHelper.empty())
        sink({.source = DockerCredentialHelperCredentialsSource{
                  .helperName = block.dockerCredentialHelper,
                  .serverURL = "https://" + std::string(registryDomain),
                  .specificity = specificity,
              }});
    else
        sink({.error = std::make_exception_ptr(Error("%s has no supported credentials arguments", locationForUI()))});
}

std::string OCIRepositoryCredentialsConfig::locationForUI() const
{
    return fmt("explicit oci_credentials \"%s\" block", block.repositoryPrefix);
}

CredentialsConfigs ociCredentialsPolicy(const CLIConfig & config, const ConfigDiscoveryEnvironment & env)
{
    std::vector<ref<const CredentialsConfig>> configs;

    /* Explicit blocks come first so that they win over anything else
       that is equally specific. */
    for (auto & block : config.ociRepositoryCredentials)
        configs.push_back(make_ref<OCIRepositoryCredentialsConfig>(block));

    if (config.ociDefaultCredentials.size() > 1)
        throw Error("the CLI configuration has more than one oci_default_credentials block");
    auto & defaults =
        config.ociDefaultCredentials.empty() ? defaultOCIDefaultCredentials() : config.ociDefaultCredentials.front();

    if (!defaults.defaultDockerCredentialHelper.empty())
        configs.push_back(make_ref<GlobalDockerCredentialHelperCredentialsConfig>(
            "oci_default_credentials block", defaults.defaultDockerCredentialHelper));

    if (!defaults.discoverAmbientCredentials)
        return CredentialsConfigs(std::move(configs));

    if (defaults.dockerStyleConfigFiles) {
        /* The operator named these files, so they had better work. */
        try {
            for (auto & c : fixedDockerCLIStyleCredentialsConfigs(*defaults.dockerStyleConfigFiles, env))
                configs.push_back(c);
        } catch (Error & e) {
            e.addPrefix("failed to read Docker-style config files: ");
            e.addPrefix("discovering ambient OCI registry credentials: ");
            throw;
        }
    } else {
        /* These files belong to other tools; a problem with one of them
           must not stop us from working. */
        try {
            for (auto & c : findDockerCLIStyleCredentialsConfigs(env))
                configs.push_back(c);
        } catch (Error & e) {
            warn("Problems during OCI registry ambient credentials discovery:\n%s", e.message());
        }
    }

    return CredentialsConfigs(std::move(configs));
}

} // namespace ociauth
