#include "ociauth/auth/credentials-source.hh"
#include "ociauth/auth/lookup-environment.hh"
#include "ociauth/util/fmt.hh"
#include "ociauth/util/util.hh"

#include <sstream>

namespace ociauth {

CredentialsSpecificity CredentialsSource::specificity() const
{
    return std::visit([](const auto & source) { return source.specificity; }, raw());
}

Credentials CredentialsSource::credentials(CredentialsLookupEnvironment & env) const
{
    return std::visit(
        overloaded{
            [](const StaticCredentialsSource & source) -> Credentials { return source.credentials; },
            [&](const DockerCredentialHelperCredentialsSource & source) -> Credentials {
                auto result = env.queryDockerCredentialHelper(source.helperName, source.serverURL);
                return Credentials::basicAuth(std::move(result.username), std::move(result.secret));
            },
        },
        raw());
}

std::string CredentialsSource::describe() const
{
    return std::visit(
        overloaded{
            [](const StaticCredentialsSource & source) {
                std::ostringstream str;
                str << "static " << source.credentials;
                return str.str();
            },
            [](const DockerCredentialHelperCredentialsSource & source) {
                return fmt("Docker credential helper '%s' for '%s'", source.helperName, source.serverURL);
            },
        },
        raw());
}

std::ostream & operator<<(std::ostream & str, const CredentialsSource & source)
{
    return str << source.describe() << " (" << source.specificity() << ")";
}

} // namespace ociauth
