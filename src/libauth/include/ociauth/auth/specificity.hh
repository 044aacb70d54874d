#pragma once
/**
 * @file
 *
 * @brief How precisely a credentials rule matches a repository.
 */

#include <compare>
#include <limits>
#include <ostream>

namespace ociauth {

/**
 * A totally-ordered measure of how specifically a credentials source
 * applies to a repository: the more specific, the greater.
 *
 * In ascending order:
 *
 * - no match at all,
 *
 * - a global fallback rule matching every registry,
 *
 * - a rule matching the registry domain only,
 *
 * - a rule matching the registry domain and the first `n` segments of
 *   the repository path, ordered by `n`.
 *
 * Callers may rely on the ordering and the `matched*()` predicates, but
 * not on the underlying encoding.
 */
class CredentialsSpecificity
{
    unsigned int encoded;

    constexpr explicit CredentialsSpecificity(unsigned int encoded)
        : encoded(encoded)
    {
    }

    static constexpr unsigned int domainEncoding = 2;

public:

    /**
     * The default is `none()`.
     */
    constexpr CredentialsSpecificity()
        : encoded(0)
    {
    }

    static constexpr CredentialsSpecificity none()
    {
        return CredentialsSpecificity(0);
    }

    static constexpr CredentialsSpecificity global()
    {
        return CredentialsSpecificity(1);
    }

    static constexpr CredentialsSpecificity domain()
    {
        return CredentialsSpecificity(domainEncoding);
    }

    /**
     * A match of the domain plus `segments` leading repository path
     * segments. Saturates rather than overflowing for absurdly large
     * segment counts; zero segments is the same as `domain()`.
     */
    static constexpr CredentialsSpecificity repository(unsigned int segments)
    {
        constexpr auto max = std::numeric_limits<unsigned int>::max();
        if (segments > max - domainEncoding)
            return CredentialsSpecificity(max);
        return CredentialsSpecificity(domainEncoding + segments);
    }

    /**
     * Whether this represents any match at all.
     */
    constexpr explicit operator bool() const
    {
        return encoded != 0;
    }

    /**
     * Whether the registry domain was matched, as opposed to a global
     * rule or no match.
     */
    constexpr bool matchedRegistryDomain() const
    {
        return encoded >= domainEncoding;
    }

    /**
     * Whether at least one repository path segment was matched.
     */
    constexpr bool matchedRepositoryPath() const
    {
        return encoded > domainEncoding;
    }

    /**
     * The number of repository path segments matched, zero unless
     * `matchedRepositoryPath()`.
     */
    constexpr unsigned int matchedRepositoryPathSegments() const
    {
        return matchedRepositoryPath() ? encoded - domainEncoding : 0;
    }

    constexpr bool operator==(const CredentialsSpecificity &) const = default;
    constexpr auto operator<=>(const CredentialsSpecificity &) const = default;
};

/**
 * Print as `none`, `global`, `domain` or `repository(N)`.
 */
std::ostream & operator<<(std::ostream & str, const CredentialsSpecificity & specificity);

} // namespace ociauth
