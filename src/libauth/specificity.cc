#include "ociauth/auth/specificity.hh"

namespace ociauth {

std::ostream & operator<<(std::ostream & str, const CredentialsSpecificity & specificity)
{
    if (specificity.matchedRepositoryPath())
        return str << "repository(" << specificity.matchedRepositoryPathSegments() << ")";
    if (specificity.matchedRegistryDomain())
        return str << "domain";
    if (specificity)
        return str << "global";
    return str << "none";
}

} // namespace ociauth
