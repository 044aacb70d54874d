#pragma once
///@file

#include "ociauth/util/types.hh"

#include <string>

namespace ociauth {

/**
 * The host facilities that ambient credentials discovery depends on.
 *
 * Everything discovery learns about its surroundings comes through
 * here, so that the platform-dependent search rules can be tested on
 * any platform without touching the real file system.
 */
class ConfigDiscoveryEnvironment
{
public:
    virtual ~ConfigDiscoveryEnvironment() {}

    /**
     * @return The value of the environment variable `name`, or the
     * empty string if it is unset.
     */
    virtual std::string environmentVariableVal(const std::string & name) const = 0;

    virtual Path userHomeDirPath() const = 0;

    /**
     * A Go-style operating system identifier: `linux`, `darwin`,
     * `windows`, or something else.
     */
    virtual std::string operatingSystemName() const = 0;

    /**
     * @throws SysError with `errNo == ENOENT` if the file does not
     * exist, or another `Error` for any other problem.
     */
    virtual std::string readFile(const Path & path) const = 0;
};

/**
 * The real host environment.
 */
class OSConfigDiscoveryEnvironment : public ConfigDiscoveryEnvironment
{
public:
    std::string environmentVariableVal(const std::string & name) const override;
    Path userHomeDirPath() const override;
    std::string operatingSystemName() const override;
    std::string readFile(const Path & path) const override;
};

} // namespace ociauth
