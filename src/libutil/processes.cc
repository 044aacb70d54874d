#include "ociauth/util/processes.hh"
#include "ociauth/util/file-descriptor.hh"
#include "ociauth/util/finally.hh"
#include "ociauth/util/logging.hh"

#include <cassert>
#include <csignal>
#include <cstring>
#include <thread>
#include <vector>

#include <pthread.h>
#include <sys/wait.h>
#include <unistd.h>

namespace ociauth {

Pid::Pid() {}

Pid::Pid(pid_t pid)
    : pid(pid)
{
}

Pid::~Pid()
{
    if (pid != -1)
        kill();
}

Pid::operator pid_t()
{
    return pid;
}

int Pid::kill()
{
    assert(pid != -1);

    debug("killing process %1%", pid);

    if (::kill(pid, killSignal) != 0) {
        /* On BSDs, killing a process group will return EPERM if all
           processes in the group are zombies (or something like
           that). So try to detect and ignore that situation. */
        if (errno != ESRCH)
            logError(SysError("killing process %d", pid).info());
    }

    return wait();
}

int Pid::wait()
{
    assert(pid != -1);
    while (1) {
        int status;
        int res = waitpid(pid, &status, 0);
        if (res == pid) {
            pid = -1;
            return status;
        }
        if (errno != EINTR)
            throw SysError("cannot get exit status of PID %d", pid);
    }
}

static std::vector<char *> stringsToCharPtrs(const Strings & ss)
{
    std::vector<char *> res;
    for (auto & s : ss)
        res.push_back((char *) s.c_str());
    res.push_back(0);
    return res;
}

std::string runProgram(Path program, bool lookupPath, const Strings & args, const std::optional<std::string> & input)
{
    auto res = runProgram(RunOptions{.program = program, .lookupPath = lookupPath, .args = args, .input = input});

    if (!statusOk(res.first))
        throw ExecError(res.first, "program '%1%' %2%", program, statusToString(res.first));

    return res.second;
}

std::pair<int, std::string> runProgram(RunOptions && options)
{
    /* Create a pipe. */
    Pipe out, in;
    out.create();
    if (options.input)
        in.create();

    Strings args_(options.args);
    args_.push_front(options.program);
    auto argv = stringsToCharPtrs(args_);

    std::vector<std::string> envStrings;
    std::vector<char *> envp;
    if (options.environment) {
        for (auto & [name, value] : *options.environment)
            envStrings.push_back(name + "=" + value);
        for (auto & s : envStrings)
            envp.push_back((char *) s.c_str());
        envp.push_back(nullptr);
    }

    /* Fork. */
    Pid pid = fork();
    if (pid == -1)
        throw SysError("unable to fork");

    if (pid == 0) {
        /* Only async-signal-safe operations from here until exec. */
        if (dup2(out.writeSide.get(), STDOUT_FILENO) == -1)
            _exit(127);
        if (options.input && dup2(in.readSide.get(), STDIN_FILENO) == -1)
            _exit(127);

        if (options.environment) {
            if (options.lookupPath)
                execvpe(options.program.c_str(), argv.data(), envp.data());
            else
                execve(options.program.c_str(), argv.data(), envp.data());
        } else {
            if (options.lookupPath)
                execvp(options.program.c_str(), argv.data());
            else
                execv(options.program.c_str(), argv.data());
        }

        _exit(127);
    }

    out.writeSide.close();

    std::thread writerThread;
    std::exception_ptr writerError;

    Finally doJoin([&] {
        if (writerThread.joinable())
            writerThread.join();
    });

    if (options.input) {
        in.readSide.close();
        writerThread = std::thread([&]() {
            /* Keep SIGPIPE from killing the whole process if the
               program exits early. */
            sigset_t set;
            sigemptyset(&set);
            sigaddset(&set, SIGPIPE);
            pthread_sigmask(SIG_BLOCK, &set, nullptr);
            try {
                writeFull(in.writeSide.get(), *options.input);
            } catch (SysError & e) {
                /* The program is free to exit without reading its
                   input; EPIPE is not an error in that case. */
                if (e.errNo != EPIPE)
                    writerError = std::current_exception();
            }
            in.writeSide.close();
        });
    }

    auto output = drainFD(out.readSide.get());

    int status = pid.wait();

    if (writerThread.joinable())
        writerThread.join();
    if (writerError)
        std::rethrow_exception(writerError);

    return {status, std::move(output)};
}

std::string statusToString(int status)
{
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        if (WIFEXITED(status))
            return fmt("failed with exit code %1%", WEXITSTATUS(status));
        else if (WIFSIGNALED(status)) {
            int sig = WTERMSIG(status);
            const char * description = strsignal(sig);
            return fmt("failed due to signal %1% (%2%)", sig, description);
        } else
            return "died abnormally";
    } else
        return "succeeded";
}

bool statusOk(int status)
{
    return WIFEXITED(status) && WEXITSTATUS(status) == 0;
}

} // namespace ociauth
