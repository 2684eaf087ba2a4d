#include <fcntl.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include "node.hpp"

///////////////////////////////////////
//// INTERNAL IOCTL - WAIT FOR IRQ ////
///////////////////////////////////////
static int xioctl (int fh, unsigned long int request, void *arg) noexcept {
    int r = ::ioctl(fh, request, arg);
    while (-1 == r && EINTR == errno) {
        r = ::ioctl(fh, request, arg);
    }
    return r;
}

vbq::io::device::device (const i32 fd, const bool nonblock, std::string name) noexcept
    : fd{fd}, nonblock{nonblock}, name{std::move(name)} {
}

vbq::io::device::~device (void) {

    if (-1 != fd and -1 == ::close(fd))
        std::fprintf(stderr, "[device] %s: close failed %d:%s\n", name.c_str(), errno, std::strerror(errno));

    fd = -1;
}

vbq::result<std::unique_ptr<vbq::io::device>>
vbq::io::device::open (const std::string& path, const bool nonblock) noexcept {

    struct stat st {};

    if (-1 == ::stat(path.c_str(), &st)) {
        const i32 err = errno;
        std::fprintf(stderr, "[device] %s: not found %d:%s\n", path.c_str(), err, std::strerror(err));
        return fail(errc::rejected, err);
    }

    if (!S_ISCHR(st.st_mode)) {
        std::fprintf(stderr, "[device] %s: not a character device\n", path.c_str());
        return fail(errc::rejected, ENODEV);
    }

    const i32 fd = ::open(path.c_str(), O_RDWR | O_CLOEXEC | (nonblock ? O_NONBLOCK : 0), 0);

    if (-1 == fd) {
        const i32 err = errno;
        std::fprintf(stderr, "[device] %s: open denied %d:%s\n", path.c_str(), err, std::strerror(err));
        return fail(errc::rejected, err);
    }

    return std::unique_ptr<device>(new device(fd, nonblock, path));
}

vbq::i32
vbq::io::device::ioctl (unsigned long request, void *arg) noexcept {

    if (-1 == xioctl(fd, request, arg))
        return errno;

    return 0;
}
