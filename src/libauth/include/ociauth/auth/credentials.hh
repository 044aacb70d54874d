#pragma once
///@file

#include <ostream>
#include <string>
#include <variant>

namespace ociauth {

/**
 * Credentials for "Basic"-style authentication.
 */
struct BasicAuthCredentials
{
    std::string username;
    std::string password;

    bool operator==(const BasicAuthCredentials &) const = default;
};

/**
 * Credentials for an OAuth-style authentication flow.
 */
struct OAuthCredentials
{
    std::string accessToken;
    std::string refreshToken;

    bool operator==(const OAuthCredentials &) const = default;
};

/**
 * The form of credentials a registry client consumes. Only one of the
 * two pairs is ever non-empty.
 */
struct RegistryAuth
{
    std::string username;
    std::string password;
    std::string accessToken;
    std::string refreshToken;

    bool operator==(const RegistryAuth &) const = default;
};

typedef std::variant<BasicAuthCredentials, OAuthCredentials> _CredentialsRaw;

/**
 * Credentials to present to an OCI registry: either a username and
 * password, or an OAuth access and refresh token.
 *
 * Printing a `Credentials` value with `<<` never reveals the secrets.
 */
struct Credentials : _CredentialsRaw
{
    using Raw = _CredentialsRaw;
    using Raw::Raw;

    static Credentials basicAuth(std::string username, std::string password)
    {
        return BasicAuthCredentials{std::move(username), std::move(password)};
    }

    static Credentials oauth(std::string accessToken, std::string refreshToken)
    {
        return OAuthCredentials{std::move(accessToken), std::move(refreshToken)};
    }

    inline const Raw & raw() const
    {
        return static_cast<const Raw &>(*this);
    }

    inline Raw & raw()
    {
        return static_cast<Raw &>(*this);
    }

    RegistryAuth toRegistryAuth() const;

    bool operator==(const Credentials &) const = default;
};

std::ostream & operator<<(std::ostream & str, const Credentials & credentials);

} // namespace ociauth
