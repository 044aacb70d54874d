#pragma once
/**
 * @file
 *
 * @brief Credentials configuration layers and their aggregation.
 */

#include "ociauth/auth/credentials-source.hh"
#include "ociauth/util/ref.hh"

#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ociauth {

/**
 * One candidate offered by a credentials configuration layer: either a
 * source or the error that prevented producing one.
 */
struct CredentialsSourceCandidate
{
    std::optional<CredentialsSource> source;
    std::exception_ptr error;
};

/**
 * Receives candidates from a layer. Returning `false` asks the layer
 * to stop producing more.
 */
typedef std::function<bool(CredentialsSourceCandidate)> CredentialsSourceSink;

/**
 * A single layer of credentials configuration: one Docker-style config
 * file, one explicit configuration block, or one synthesized global
 * rule.
 *
 * Layers are immutable once constructed.
 */
class CredentialsConfig
{
public:
    virtual ~CredentialsConfig() {}

    /**
     * Pass every source in this layer that matches the given repository
     * to `sink`, in declaration order. A layer may offer any number of
     * candidates for one repository, with differing specificities.
     */
    virtual void credentialsSourcesForRepository(
        std::string_view registryDomain, std::string_view repositoryPath, const CredentialsSourceSink & sink) const = 0;

    /**
     * Where this layer came from, for messages only.
     */
    virtual std::string locationForUI() const = 0;
};

/**
 * A layer consisting of a single credential helper that applies to all
 * registries at global specificity.
 */
class GlobalDockerCredentialHelperCredentialsConfig : public CredentialsConfig
{
    std::string location;
    std::string helperName;

public:
    GlobalDockerCredentialHelperCredentialsConfig(std::string location, std::string helperName);

    void credentialsSourcesForRepository(
        std::string_view registryDomain,
        std::string_view repositoryPath,
        const CredentialsSourceSink & sink) const override;

    std::string locationForUI() const override;
};

/**
 * The outcome of a successful `CredentialsConfigs` query.
 */
struct CredentialsSourceResult
{
    CredentialsSource source;

    /**
     * `locationForUI()` of the layer that offered `source`.
     */
    std::string location;

    /**
     * Problems with other layers or candidates that did not prevent
     * finding `source`, or null. Callers typically report these as
     * warnings.
     */
    std::exception_ptr errors;
};

/**
 * The full credentials policy: an ordered list of layers, earlier ones
 * taking precedence over later ones when equally specific.
 */
class CredentialsConfigs
{
    std::vector<ref<const CredentialsConfig>> configs;

public:
    CredentialsConfigs() {}

    explicit CredentialsConfigs(std::vector<ref<const CredentialsConfig>> configs);

    /**
     * Select the best credentials source for a repository: the most
     * specific candidate of any layer, the earliest one on a tie.
     *
     * A candidate error that is a "not found" error is ignored; any
     * other is recorded against the location of its layer and
     * reported in the result without stopping the search.
     *
     * @throws CredentialsNotFoundError if nothing matches, or a
     * `JoinedError` containing one along with the errors encountered.
     */
    CredentialsSourceResult credentialsSourceForRepository(std::string_view registryDomain, std::string_view repositoryPath) const;

    /**
     * The layers in precedence order.
     */
    const std::vector<ref<const CredentialsConfig>> & allConfigs() const
    {
        return configs;
    }
};

} // namespace ociauth
