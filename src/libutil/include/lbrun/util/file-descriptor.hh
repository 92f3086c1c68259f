#pragma once
///@file

#include "lbrun/util/error.hh"

#include <string>
#include <string_view>

namespace lbrun {

/**
 * Read from `fd` until end of file.
 */
std::string readFile(int fd);

/**
 * Write all of `s` to `fd`, retrying on short writes and EINTR.
 */
void writeFull(int fd, std::string_view s);

/**
 * Owns a file descriptor and closes it when it goes out of scope.
 */
class AutoCloseFD
{
    int fd = -1;

public:
    AutoCloseFD() = default;
    AutoCloseFD(int fd);
    AutoCloseFD(const AutoCloseFD &) = delete;
    AutoCloseFD(AutoCloseFD && that) noexcept;
    ~AutoCloseFD();

    AutoCloseFD & operator=(const AutoCloseFD &) = delete;
    AutoCloseFD & operator=(AutoCloseFD && that);

    int get() const
    {
        return fd;
    }

    explicit operator bool() const
    {
        return fd != -1;
    }

    void close();
};

/**
 * A close-on-exec pipe.
 */
struct Pipe
{
    AutoCloseFD readSide, writeSide;

    void create();
};

} // namespace lbrun
