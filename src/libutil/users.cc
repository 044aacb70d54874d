#include "ociauth/util/users.hh"
#include "ociauth/util/environment-variables.hh"
#include "ociauth/util/error.hh"
#include "ociauth/util/logging.hh"

#include <pwd.h>
#include <unistd.h>

#include <vector>

namespace ociauth {

Path getHomeOf(uid_t userId)
{
    std::vector<char> buf(16384);
    struct passwd pwbuf;
    struct passwd * pw;
    if (getpwuid_r(userId, &pwbuf, buf.data(), buf.size(), &pw) != 0 || !pw || !pw->pw_dir || !pw->pw_dir[0])
        throw Error("cannot determine home directory of user %d", userId);
    return pw->pw_dir;
}

Path getHome()
{
    if (auto homeDir = getEnvNonEmpty("HOME"))
        return *homeDir;
    try {
        return getHomeOf(geteuid());
    } catch (Error & e) {
        debug("%s; using '/' instead", e.message());
        return "/";
    }
}

} // namespace ociauth
