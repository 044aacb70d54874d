#include "ociauth/auth/discovery-environment.hh"
#include "ociauth/util/environment-variables.hh"
#include "ociauth/util/file-system.hh"
#include "ociauth/util/logging.hh"
#include "ociauth/util/users.hh"

namespace ociauth {

std::string OSConfigDiscoveryEnvironment::environmentVariableVal(const std::string & name) const
{
    return getEnv(name).value_or("");
}

Path OSConfigDiscoveryEnvironment::userHomeDirPath() const
{
    return getHome();
}

std::string OSConfigDiscoveryEnvironment::operatingSystemName() const
{
#if defined(__linux__)
    return "linux";
#elif defined(__APPLE__)
    return "darwin";
#elif defined(__FreeBSD__)
    return "freebsd";
#elif defined(__OpenBSD__)
    return "openbsd";
#elif defined(__NetBSD__)
    return "netbsd";
#else
    return "unknown";
#endif
}

std::string OSConfigDiscoveryEnvironment::readFile(const Path & path) const
{
    vomit("reading '%s' for OCI credentials discovery", path);
    return ociauth::readFile(path);
}

} // namespace ociauth
