#pragma once
///@file

#include "ociauth/auth/credentials.hh"
#include "ociauth/auth/specificity.hh"

#include <variant>

namespace ociauth {

class CredentialsLookupEnvironment;

/**
 * Credentials that are known up front.
 */
struct StaticCredentialsSource
{
    Credentials credentials;
    CredentialsSpecificity specificity;

    bool operator==(const StaticCredentialsSource &) const = default;
};

/**
 * Credentials to be fetched from a Docker-style credential helper
 * program, only once they are actually needed.
 */
struct DockerCredentialHelperCredentialsSource
{
    std::string helperName;

    /**
     * What to ask the helper for, e.g. `https://example.com`.
     */
    std::string serverURL;

    CredentialsSpecificity specificity;

    bool operator==(const DockerCredentialHelperCredentialsSource &) const = default;
};

typedef std::variant<StaticCredentialsSource, DockerCredentialHelperCredentialsSource> _CredentialsSourceRaw;

/**
 * Where the credentials for a repository come from, tagged with how
 * specifically that source matched the repository.
 *
 * This is a closed set: a static value or a credential helper.
 */
struct CredentialsSource : _CredentialsSourceRaw
{
    using Raw = _CredentialsSourceRaw;
    using Raw::Raw;

    inline const Raw & raw() const
    {
        return static_cast<const Raw &>(*this);
    }

    CredentialsSpecificity specificity() const;

    /**
     * Produce the actual credentials. For a credential helper this
     * runs the helper through `env`.
     *
     * @throws CredentialsNotFoundError if the helper has no credentials
     * for the server.
     */
    Credentials credentials(CredentialsLookupEnvironment & env) const;

    /**
     * A short human-readable description that does not include any
     * secrets.
     */
    std::string describe() const;

    bool operator==(const CredentialsSource &) const = default;
};

std::ostream & operator<<(std::ostream & str, const CredentialsSource & source);

} // namespace ociauth
