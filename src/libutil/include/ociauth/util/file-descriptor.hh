#pragma once
///@file

#include "ociauth/util/types.hh"
#include "ociauth/util/error.hh"

#include <unistd.h>

namespace ociauth {

/**
 * Operating System capability
 */
using Descriptor = int;

const Descriptor INVALID_DESCRIPTOR = -1;

/**
 * Read the contents of a resource into a string.
 */
std::string readFile(Descriptor fd);

/**
 * Wrapper around write() that writes exactly the requested number of
 * bytes.
 */
void writeFull(Descriptor fd, std::string_view s, bool allowInterrupts = true);

/**
 * Read a file descriptor until EOF occurs.
 */
std::string drainFD(Descriptor fd, const size_t reserveSize = 0);

class AutoCloseFD
{
    Descriptor fd;
public:
    AutoCloseFD();
    AutoCloseFD(Descriptor fd);
    AutoCloseFD(const AutoCloseFD & fd) = delete;
    AutoCloseFD(AutoCloseFD && fd) noexcept;
    ~AutoCloseFD();
    AutoCloseFD & operator=(const AutoCloseFD & fd) = delete;
    AutoCloseFD & operator=(AutoCloseFD && fd);
    Descriptor get() const;
    explicit operator bool() const;
    void close();
};

class Pipe
{
public:
    AutoCloseFD readSide, writeSide;
    void create();
    void close();
};

} // namespace ociauth
