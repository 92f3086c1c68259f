#include "lbrun/util/file-descriptor.hh"
#include "lbrun/util/util.hh"

#include <cerrno>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace lbrun {

std::string readFile(int fd)
{
    std::string res;
    char buf[16384];
    for (;;) {
        auto n = ::read(fd, buf, sizeof(buf));
        if (n == 0)
            return res;
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("reading from file descriptor %d", fd);
        }
        res.append(buf, n);
    }
}

void writeFull(int fd, std::string_view s)
{
    while (!s.empty()) {
        auto n = ::write(fd, s.data(), s.size());
        if (n == -1) {
            if (errno == EINTR)
                continue;
            throw SysError("writing to file descriptor %d", fd);
        }
        s.remove_prefix(n);
    }
}

AutoCloseFD::AutoCloseFD(int fd)
    : fd(fd)
{
}

AutoCloseFD::AutoCloseFD(AutoCloseFD && that) noexcept
    : fd(that.fd)
{
    that.fd = -1;
}

AutoCloseFD & AutoCloseFD::operator=(AutoCloseFD && that)
{
    if (this != &that) {
        close();
        std::swap(fd, that.fd);
    }
    return *this;
}

AutoCloseFD::~AutoCloseFD()
{
    try {
        close();
    } catch (...) {
        ignoreExceptionInDestructor();
    }
}

void AutoCloseFD::close()
{
    if (fd == -1)
        return;
    int old = fd;
    fd = -1;
    if (::close(old) == -1)
        throw SysError("closing file descriptor %d", old);
}

void Pipe::create()
{
    int fds[2];
    if (pipe2(fds, O_CLOEXEC) == -1)
        throw SysError("creating pipe");
    readSide = AutoCloseFD(fds[0]);
    writeSide = AutoCloseFD(fds[1]);
}

} // namespace lbrun
