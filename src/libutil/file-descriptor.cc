#include "ociauth/util/file-descriptor.hh"
#include "ociauth/util/logging.hh"

#include <fcntl.h>
#include <sys/stat.h>

namespace ociauth {

std::string readFile(Descriptor fd)
{
    struct stat st;
    if (fstat(fd, &st) == -1)
        throw SysError("statting file");

    return drainFD(fd, st.st_size);
}

void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts)
{
    while (!s.empty()) {
        ssize_t res = write(fd, s.data(), s.size());
        if (res == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file");
        }
        if (res > 0)
            s.remove_prefix(res);
    }
}

std::string drainFD(Descriptor fd, const size_t reserveSize)
{
    std::string s;
    s.reserve(reserveSize);

    std::vector<char> buf(64 * 1024);
    while (1) {
        ssize_t rd = read(fd, buf.data(), buf.size());
        if (rd == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading from file");
        } else if (rd == 0)
            break;
        else
            s.append(buf.data(), rd);
    }
    return s;
}

//////////////////////////////////////////////////////////////////////

AutoCloseFD::AutoCloseFD()
    : fd{INVALID_DESCRIPTOR}
{
}

AutoCloseFD::AutoCloseFD(Descriptor fd)
    : fd{fd}
{
}

AutoCloseFD::AutoCloseFD(AutoCloseFD && that) noexcept
    : fd{that.fd}
{
    that.fd = INVALID_DESCRIPTOR;
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    close();
    fd = that.fd;
    that.fd = INVALID_DESCRIPTOR;
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (SysError & e) {
        logError(e.info());
    }
}

Descriptor AutoCloseFD::get() const
{
    return fd;
}

void AutoCloseFD::close()
{
    if (fd != INVALID_DESCRIPTOR) {
        if (::close(fd) == -1)
            /* This should never happen. */
            throw SysError("closing file descriptor %1%", fd);
        fd = INVALID_DESCRIPTOR;
    }
}

AutoCloseFD::operator bool() const
{
    return fd != INVALID_DESCRIPTOR;
}

//////////////////////////////////////////////////////////////////////

void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
        throw SysError("creating pipe");
    readSide = fds[0];
    writeSide = fds[1];
}

void Pipe::close()
{
    readSide.close();
    writeSide.close();
}

} // namespace ociauth
