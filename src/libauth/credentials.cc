#include "ociauth/auth/credentials.hh"
#include "ociauth/util/util.hh"

namespace ociauth {

RegistryAuth Credentials::toRegistryAuth() const
{
    return std::visit(
        overloaded{
            [](const BasicAuthCredentials & basic) -> RegistryAuth {
                return {.username = basic.username, .password = basic.password};
            },
            [](const OAuthCredentials & oauth) -> RegistryAuth {
                return {.accessToken = oauth.accessToken, .refreshToken = oauth.refreshToken};
            },
        },
        raw());
}

std::ostream & operator<<(std::ostream & str, const Credentials & credentials)
{
    std::visit(
        overloaded{
            [&](const BasicAuthCredentials & basic) { str << "basic auth credentials for user '" << basic.username << "'"; },
            [&](const OAuthCredentials &) { str << "OAuth credentials"; },
        },
        credentials.raw());
    return str;
}

} // namespace ociauth
