#include "ociauth/main/shared.hh"
#include "ociauth/util/ansicolor.hh"
#include "ociauth/util/exit.hh"
#include "ociauth/util/file-system.hh"
#include "ociauth/util/logging.hh"

#include <algorithm>
#include <cctype>
#include <exception>
#include <iostream>
#include <type_traits>

#include <signal.h>

namespace ociauth {

void initOCIAuth()
{
    /* Reset SIGCHLD to its default, since we wait for credential
       helpers. */
    struct sigaction act;
    sigemptyset(&act.sa_mask);
    act.sa_flags = 0;
    act.sa_handler = SIG_DFL;
    if (sigaction(SIGCHLD, &act, 0))
        throw SysError("resetting SIGCHLD");

    /* A credential helper may exit without reading its input. */
    act.sa_handler = SIG_IGN;
    if (sigaction(SIGPIPE, &act, 0))
        throw SysError("ignoring SIGPIPE");
}

Strings argvToStrings(int argc, char ** argv)
{
    Strings args;
    argc--;
    argv++;
    while (argc--)
        args.push_back(*argv++);
    return args;
}

std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end)
{
    ++i;
    if (i == end)
        throw UsageError("'%1%' requires an argument", opt);
    return *i;
}

void parseCmdLine(int argc, char ** argv, ArgParser parseArg)
{
    parseCmdLine(std::string(baseNameOf(argv[0])), argvToStrings(argc, argv), parseArg);
}

void parseCmdLine(const std::string & programName, const Strings & args, ArgParser parseArg)
{
    Strings cmdline;
    bool dashDash = false;

    for (auto & arg : args) {
        if (dashDash)
            cmdline.push_back(arg);
        else if (arg == "--") {
            dashDash = true;
            cmdline.push_back(arg);
        }
        /* Expand compound dash options (i.e., `-vv' -> `-v -v'). */
        else if (arg.length() > 2 && arg[0] == '-' && arg[1] != '-' && isalpha(arg[1])) {
            for (size_t j = 1; j < arg.length(); j++)
                if (isalpha(arg[j]))
                    cmdline.push_back(std::string("-") + arg[j]);
                else {
                    cmdline.push_back(std::string(arg, j));
                    break;
                }
        } else if (arg.starts_with("--") && arg.find('=') != arg.npos) {
            auto eq = arg.find('=');
            cmdline.push_back(std::string(arg, 0, eq));
            cmdline.push_back(std::string(arg, eq + 1));
        } else
            cmdline.push_back(arg);
    }

    dashDash = false;
    for (auto pos = cmdline.begin(); pos != cmdline.end(); ++pos) {
        auto & arg = *pos;

        if (!dashDash && arg == "--") {
            dashDash = true;
            continue;
        }

        bool isFlag = !dashDash && arg.size() > 1 && arg[0] == '-';

        if (isFlag && (arg == "--verbose" || arg == "-v"))
            verbosity = (Verbosity) std::min<std::underlying_type_t<Verbosity>>(verbosity + 1, lvlVomit);
        else if (isFlag && arg == "--quiet")
            verbosity = verbosity > lvlError ? (Verbosity) (verbosity - 1) : lvlError;
        else if (isFlag && arg == "--debug")
            verbosity = lvlDebug;
        else if (!parseArg(pos, cmdline.end())) {
            if (isFlag)
                throw UsageError("unrecognised flag '%1%'", arg);
            throw UsageError("unexpected argument '%1%'", arg);
        }
    }
}

void printVersion(const std::string & programName)
{
    std::cout << fmt("%1% (ociauth) %2%", programName, OCIAUTH_VERSION) << std::endl;
    throw Exit();
}

int handleExceptions(const std::string & programName, std::function<void()> fun)
{
    ErrorInfo::programName = baseNameOf(programName);

    std::string error = ANSI_RED "error:" ANSI_NORMAL " ";
    try {
        fun();
    } catch (Exit & e) {
        return e.status;
    } catch (UsageError & e) {
        logError(e.info());
        printError("Try '%1% --help' for more information.", programName);
        return 1;
    } catch (BaseError & e) {
        logError(e.info());
        return e.info().status;
    } catch (std::bad_alloc & e) {
        printError(error + "out of memory");
        return 1;
    } catch (std::exception & e) {
        printError(error + e.what());
        return 1;
    }

    return 0;
}

} // namespace ociauth
