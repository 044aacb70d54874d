#pragma once
/**
 * @file
 *
 * @brief Credentials from Docker CLI-style configuration files.
 *
 * These files are shared by many tools in the container ecosystem
 * (Docker, Podman, Buildah, ...) and use the format described in
 * https://github.com/containers/image/blob/main/docs/containers-auth.json.5.md :
 *
 * ```
 * {
 *   "auths": { "<domain>[/<path>...]": { "auth": "<base64 user:pass>" } },
 *   "credHelpers": { "<domain>": "<helper-name>" },
 *   "credsStore": "<helper-name>"
 * }
 * ```
 */

#include "ociauth/auth/credentials-config.hh"
#include "ociauth/auth/discovery-environment.hh"
#include "ociauth/util/types.hh"

#include <map>
#include <optional>

namespace ociauth {

/**
 * How well the name of a property of an `auths` object, such as
 * `example.com` or `example.com/foo/bar`, matches a repository.
 *
 * A bare domain matches every repository on that registry at domain
 * specificity. A domain with a path matches repositories whose path
 * starts with all of its segments, at a specificity that grows with the
 * number of segments in the property name.
 *
 * Property names that cannot be parsed never match: these files are not
 * ours and may contain entries we don't understand.
 *
 * The same rules apply to the prefixes of explicit `oci_credentials`
 * blocks.
 */
CredentialsSpecificity
containersAuthPropertyNameMatch(std::string_view authsPropertyName, std::string_view wantRegistryDomain, std::string_view wantRepositoryPath);

/**
 * One parsed Docker CLI-style configuration file.
 *
 * Only the overall structure is checked at construction time; the
 * individual `auth` strings are decoded when they are first matched.
 */
class DockerCLIStyleCredentialsConfig : public CredentialsConfig
{
    Path filename;

    /**
     * Property name to base64-encoded `user:password`. Entries that are
     * `null`, empty objects or have an empty `auth` are dropped.
     */
    std::map<std::string, std::string> auths;

    std::map<std::string, std::string, std::less<>> credHelpers;

    std::optional<std::string> credsStore;

public:

    /**
     * @throws Error if `contents` is not JSON of the expected shape.
     */
    DockerCLIStyleCredentialsConfig(std::string_view contents, Path filename);

    void credentialsSourcesForRepository(
        std::string_view registryDomain,
        std::string_view repositoryPath,
        const CredentialsSourceSink & sink) const override;

    std::string locationForUI() const override;
};

/**
 * The files that automatic discovery tries, in precedence order.
 * Depends only on `env`'s operating system name, home directory and
 * environment variables; nothing is read.
 *
 * The list may contain the same path twice in a row.
 */
Paths dockerCLIStyleAuthFileSearchLocations(const ConfigDiscoveryEnvironment & env);

/**
 * Load whichever of `dockerCLIStyleAuthFileSearchLocations()` exist.
 *
 * Missing files are skipped silently.
 *
 * @throws Error (possibly a `JoinedError`) describing every file that
 * exists but could not be read or parsed.
 */
std::vector<ref<const CredentialsConfig>> findDockerCLIStyleCredentialsConfigs(const ConfigDiscoveryEnvironment & env);

/**
 * Load exactly the given files, which an operator named explicitly.
 *
 * @throws Error (possibly a `JoinedError`) describing every file that
 * is missing or could not be read or parsed.
 */
std::vector<ref<const CredentialsConfig>>
fixedDockerCLIStyleCredentialsConfigs(const Paths & filePaths, const ConfigDiscoveryEnvironment & env);

} // namespace ociauth
