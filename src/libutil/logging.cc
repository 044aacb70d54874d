#include "ociauth/util/logging.hh"
#include "ociauth/util/file-descriptor.hh"
#include "ociauth/util/terminal.hh"

#include <sstream>

namespace ociauth {

std::unique_ptr<Logger> logger = makeSimpleLogger();

Verbosity verbosity = lvlInfo;

void Logger::warn(const std::string & msg)
{
    log(lvlWarn, ANSI_WARNING "warning:" ANSI_NORMAL " " + msg);
}

void Logger::writeToStdout(std::string_view s)
{
    writeFull(STDOUT_FILENO, s);
    writeFull(STDOUT_FILENO, "\n");
}

class SimpleLogger : public Logger
{
public:

    bool tty;

    SimpleLogger()
    {
        tty = isTTY();
    }

    void log(Verbosity lvl, std::string_view s) override
    {
        if (lvl > verbosity)
            return;

        writeToStderr(filterANSIEscapes(s, !tty) + "\n");
    }

    void logEI(const ErrorInfo & ei) override
    {
        std::ostringstream oss;
        showErrorInfo(oss, ei);

        log(ei.level, oss.str());
    }
};

void writeToStderr(std::string_view s)
{
    try {
        writeFull(STDERR_FILENO, s, false);
    } catch (SystemError & e) {
        /* Ignore failing writes to stderr.  We need to ignore write
           errors to ensure that cleanup code that logs to stderr runs
           to completion if the other side of stderr has been closed
           unexpectedly. */
    }
}

std::unique_ptr<Logger> makeSimpleLogger()
{
    return std::make_unique<SimpleLogger>();
}

} // namespace ociauth
