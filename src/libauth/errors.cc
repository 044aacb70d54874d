#include "ociauth/auth/errors.hh"

namespace ociauth {

bool isCredentialsNotFoundError(const std::exception & e)
{
    if (dynamic_cast<const CredentialsNotFoundError *>(&e))
        return true;
    if (auto joined = dynamic_cast<const JoinedError *>(&e))
        return joined->contains<CredentialsNotFoundError>();
    return false;
}

bool isCredentialsNotFoundError(const std::exception_ptr & e)
{
    if (!e)
        return false;
    try {
        std::rethrow_exception(e);
    } catch (const std::exception & e2) {
        return isCredentialsNotFoundError(e2);
    }
}

} // namespace ociauth
