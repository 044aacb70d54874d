#include "ociauth/auth/credentials-config.hh"
#include "ociauth/auth/errors.hh"
#include "ociauth/util/logging.hh"

namespace ociauth {

GlobalDockerCredentialHelperCredentialsConfig::GlobalDockerCredentialHelperCredentialsConfig(
    std::string location, std::string helperName)
    : location(std::move(location))
    , helperName(std::move(helperName))
{
}

void GlobalDockerCredentialHelperCredentialsConfig::credentialsSourcesForRepository(
    std::string_view registryDomain, std::string_view repositoryPath, const CredentialsSourceSink & sink) const
{
    sink({.source = DockerCredentialHelperCredentialsSource{
              .helperName = helperName,
              .serverURL = "https://" + std::string(registryDomain),
              .specificity = CredentialsSpecificity::global(),
          }});
}

std::string GlobalDockerCredentialHelperCredentialsConfig::locationForUI() const
{
    return location;
}

CredentialsConfigs::CredentialsConfigs(std::vector<ref<const CredentialsConfig>> configs)
    : configs(std::move(configs))
{
}

CredentialsSourceResult
CredentialsConfigs::credentialsSourceForRepository(std::string_view registryDomain, std::string_view repositoryPath) const
{
    std::optional<CredentialsSource> best;
    std::string bestLocation;
    std::vector<std::exception_ptr> errors;

    for (auto & config : configs) {
        auto location = config->locationForUI();
        debug("looking for credentials for '%s/%s' in %s", registryDomain, repositoryPath, location);

        config->credentialsSourcesForRepository(
            registryDomain, repositoryPath, [&](CredentialsSourceCandidate candidate) {
                if (candidate.error) {
                    if (!isCredentialsNotFoundError(candidate.error))
                        appendError(errors, Error("%s: %s", location, exceptionMessage(candidate.error)));
                    return true;
                }
                if (!candidate.source)
                    return true;
                auto specificity = candidate.source->specificity();
                /* Strictly greater, so that the earliest declaration wins
                   a tie. */
                if (specificity > (best ? best->specificity() : CredentialsSpecificity::none())) {
                    vomit("%s offers %s", location, *candidate.source);
                    best = std::move(*candidate.source);
                    bestLocation = location;
                }
                return true;
            });
    }

    if (!best) {
        auto notFound = std::make_exception_ptr(CredentialsNotFoundError(
            "no credentials configured for '%s'",
            repositoryPath.empty() ? std::string(registryDomain)
                                   : std::string(registryDomain) + "/" + std::string(repositoryPath)));
        if (errors.empty())
            std::rethrow_exception(notFound);
        errors.insert(errors.begin(), notFound);
        throw JoinedError(std::move(errors));
    }

    debug("using %s from %s", *best, bestLocation);

    CredentialsSourceResult result{.source = std::move(*best), .location = bestLocation};
    if (errors.size() == 1)
        result.errors = errors.front();
    else if (!errors.empty())
        result.errors = std::make_exception_ptr(JoinedError(std::move(errors)));
    return result;
}

} // namespace ociauth
