#pragma once
///@file

#include "ociauth/util/types.hh"

#include <sys/types.h>

namespace ociauth {

/**
 * @return the given user's home directory from /etc/passwd.
 *
 * @throws Error if the passwd entry does not exist or has no home
 * directory.
 */
Path getHomeOf(uid_t userId);

/**
 * @return $HOME, else the current user's home directory from
 * /etc/passwd, else `/` as a last resort.
 *
 * Unlike a shell, this never fails: the result is only used as a base
 * directory to probe for configuration files.
 */
Path getHome();

} // namespace ociauth
