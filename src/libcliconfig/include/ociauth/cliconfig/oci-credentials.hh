#pragma once
/**
 * @file
 *
 * @brief The operator's OCI registry credentials settings, and the
 * credentials policy they describe.
 *
 * The settings live in JSON CLI configuration files:
 *
 * ```
 * {
 *   "oci_default_credentials": {
 *     "discover_ambient_credentials": true,
 *     "docker_style_config_files": ["auth.json"],
 *     "docker_credentials_helper": "osxkeychain"
 *   },
 *   "oci_credentials": {
 *     "example.com/foo": { "username": "...", "password": "..." },
 *     "example.net": { "access_token": "...", "refresh_token": "..." },
 *     "example.org": { "docker_credentials_helper": "pass" }
 *   }
 * }
 * ```
 *
 * Both blocks may also be given as arrays of objects, which is how a
 * repeated block is written in JSON.
 */

#include "ociauth/auth/credentials-config.hh"
#include "ociauth/auth/discovery-environment.hh"
#include "ociauth/util/error.hh"
#include "ociauth/util/types.hh"

#include <optional>
#include <string>
#include <vector>

namespace ociauth {

/**
 * One or more problems with the CLI configuration. The message has one
 * line per problem, each naming the block it concerns.
 */
class CLIConfigError : public Error
{
    Strings problems;

public:
    explicit CLIConfigError(Strings problems);

    const Strings & getProblems() const
    {
        return problems;
    }
};

/**
 * The contents of an `oci_default_credentials` block.
 */
struct OCIDefaultCredentials
{
    /**
     * Whether to look for credentials in configuration files belonging
     * to other tools, such as Docker's or Podman's.
     */
    bool discoverAmbientCredentials = true;

    /**
     * Exactly which Docker-style configuration files to use. Unset means
     * searching the usual locations; an empty list means using none.
     *
     * Always unset if `discoverAmbientCredentials` is false. Entries are
     * absolute.
     */
    std::optional<Paths> dockerStyleConfigFiles;

    /**
     * Credential helper for any registry that has no more specific
     * configuration, or empty.
     */
    std::string defaultDockerCredentialHelper;

    /**
     * Where the block was declared, for messages only.
     */
    std::string declaredAt;

    bool operator==(const OCIDefaultCredentials &) const = default;
};

/**
 * The settings that apply when the configuration has no
 * `oci_default_credentials` block.
 */
const OCIDefaultCredentials & defaultOCIDefaultCredentials();

/**
 * The contents of one `oci_credentials` block. Exactly one of the three
 * kinds of credentials is set.
 */
struct OCIRepositoryCredentials
{
    /**
     * The block label: a registry domain, optionally followed by a
     * repository path prefix. Matched like the property names of a
     * Docker-style `auths` object.
     */
    std::string repositoryPrefix;

    std::string username;
    std::string password;

    std::string accessToken;
    std::string refreshToken;

    /**
     * Only allowed when `repositoryPrefix` has no path, since helpers
     * work per registry.
     */
    std::string dockerCredentialHelper;

    std::string declaredAt;

    bool operator==(const OCIRepositoryCredentials &) const = default;
};

/**
 * The OCI-related parts of the CLI configuration, possibly merged from
 * several files.
 */
struct CLIConfig
{
    /**
     * At most one after validation.
     */
    std::vector<OCIDefaultCredentials> ociDefaultCredentials;

    /**
     * In the order the files were loaded, and sorted by label within
     * each file. Prefixes are unique after validation.
     */
    std::vector<OCIRepositoryCredentials> ociRepositoryCredentials;

    /**
     * Append the blocks of `other`, which was loaded after this one.
     */
    void merge(const CLIConfig & other);

    /**
     * Check the constraints that span files.
     *
     * @throws CLIConfigError listing every problem.
     */
    void validate() const;
};

/**
 * Decode the OCI credentials blocks of one CLI configuration file.
 * Other top-level properties are left for other parts of the program.
 * Relative paths are resolved against the directory containing
 * `filename`.
 *
 * @throws CLIConfigError listing every invalid block.
 * @throws Error if `contents` isn't a JSON object.
 */
CLIConfig parseCLIConfig(std::string_view contents, const Path & filename);

/**
 * Read and decode one CLI configuration file.
 */
CLIConfig loadCLIConfigFile(const Path & path);

/**
 * Read, merge and validate the given CLI configuration files, in order.
 */
CLIConfig loadCLIConfig(const Paths & paths);

/**
 * The credentials layer of a single `oci_credentials` block. It offers
 * at most one source, at the specificity with which the block label
 * matches the repository.
 */
class OCIRepositoryCredentialsConfig : public CredentialsConfig
{
    OCIRepositoryCredentials block;

public:
    explicit OCIRepositoryCredentialsConfig(OCIRepositoryCredentials block);

    void credentialsSourcesForRepository(
        std::string_view registryDomain,
        std::string_view repositoryPath,
        const CredentialsSourceSink & sink) const override;

    std::string locationForUI() const override;
};

/**
 * Assemble the full credentials policy described by a validated
 * configuration. The layers are, in precedence order:
 *
 * 1. One per `oci_credentials` block.
 *
 * 2. The default credential helper, if there is one.
 *
 * 3. Ambient Docker-style configuration files, unless discovery is
 *    disabled. Problems with files found by searching are only
 *    warned about; problems with files named by
 *    `docker_style_config_files` are errors.
 *
 * @throws Error if ambient discovery fails.
 */
CredentialsConfigs ociCredentialsPolicy(const CLIConfig & config, const ConfigDiscoveryEnvironment & env);

} // namespace ociauth
