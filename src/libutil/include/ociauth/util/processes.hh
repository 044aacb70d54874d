#pragma once
///@file

#include "ociauth/util/types.hh"
#include "ociauth/util/error.hh"

#include <sys/types.h>
#include <signal.h>

#include <optional>

namespace ociauth {

class Pid
{
    pid_t pid = -1;
    int killSignal = SIGKILL;
public:
    Pid();
    Pid(pid_t pid);
    ~Pid();
    operator pid_t();
    int kill();
    int wait();
};

struct RunOptions
{
    Path program;
    bool lookupPath = true;
    Strings args;
    std::optional<StringMap> environment;
    std::optional<std::string> input;
};

/**
 * Run a program and return its exit status together with everything
 * it wrote to stdout.
 *
 * A program that cannot be started at all (for example because it is
 * not on `PATH`) is reported as exit status 127, like the shell does.
 */
std::pair<int, std::string> runProgram(RunOptions && options);

/**
 * Run a program and return its stdout in a string (i.e., like the
 * shell backtick operator).
 *
 * @throws ExecError if the program exits unsuccessfully.
 */
std::string runProgram(
    Path program, bool lookupPath = false, const Strings & args = Strings(), const std::optional<std::string> & input = {});

class ExecError : public Error
{
public:
    int status;

    template<typename... Args>
    ExecError(int status, const Args &... args)
        : Error(args...)
        , status(status)
    {
    }
};

/**
 * Convert the exit status of a child as returned by wait() into an
 * error string.
 */
std::string statusToString(int status);

bool statusOk(int status);

} // namespace ociauth
