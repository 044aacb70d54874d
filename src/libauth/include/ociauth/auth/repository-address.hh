#pragma once
///@file

#include "ociauth/util/error.hh"

#include <string>
#include <string_view>

namespace ociauth {

MakeError(BadRepositoryAddress, Error);

/**
 * An OCI repository address split into its registry domain (hostname
 * with optional port) and its `/`-separated repository path.
 */
struct RepositoryAddress
{
    std::string registryDomain;

    /**
     * Empty when the address covers a whole registry.
     */
    std::string repositoryPath;

    std::string to_string() const;

    bool operator==(const RepositoryAddress &) const = default;
};

/**
 * Parse a repository address prefix like `example.com` or
 * `example.com:5000/foo/bar`, as used to say which repositories a
 * credentials rule applies to. The path part is optional.
 *
 * @throws BadRepositoryAddress if the domain or any path segment is
 * syntactically invalid, or if the address ends in a tag or digest.
 */
RepositoryAddress parseRepositoryAddressPrefix(std::string_view s);

/**
 * Like `parseRepositoryAddressPrefix()`, but the repository path is
 * required.
 */
RepositoryAddress parseRepositoryAddress(std::string_view s);

} // namespace ociauth
