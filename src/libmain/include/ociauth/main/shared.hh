#pragma once
///@file

#include "ociauth/util/error.hh"
#include "ociauth/util/types.hh"

#include <functional>

namespace ociauth {

/**
 * Run `fun`, reporting any exception it throws on standard error in
 * the usual format.
 *
 * @return The process exit status.
 */
int handleExceptions(const std::string & programName, std::function<void()> fun);

/**
 * Process-wide setup that every `ociauth` program needs before doing
 * anything else.
 */
void initOCIAuth();

/**
 * Called for each command-line argument that isn't one of the common
 * flags. `arg` may be advanced to consume an option's value. Returns
 * false if the argument is not recognised.
 */
typedef std::function<bool(Strings::iterator & arg, const Strings::iterator & end)> ArgParser;

/**
 * Parse the command line, handling the logging flags (`--verbose`/`-v`,
 * `--quiet`, `--debug`) and passing everything else to `parseArg`.
 *
 * Compound short flags are expanded (`-vv` is `-v -v`), as is
 * `--flag=value` (`--flag value`). Arguments after `--` are always
 * passed on as positional arguments.
 *
 * @throws UsageError for anything `parseArg` rejects.
 */
void parseCmdLine(int argc, char ** argv, ArgParser parseArg);

void parseCmdLine(const std::string & programName, const Strings & args, ArgParser parseArg);

/**
 * Print the program version and exit.
 */
[[noreturn]] void printVersion(const std::string & programName);

/**
 * Return the value of the option `opt` following `i`, advancing `i`.
 */
std::string getArg(const std::string & opt, Strings::iterator & i, const Strings::iterator & end);

Strings argvToStrings(int argc, char ** argv);

} // namespace ociauth
