#include <sys/mman.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>
#include "mmap.hpp"

vbq::mm::mapping::mapping (void* addr, const std::size_t len) noexcept
    : addr{addr}, len{len} {
}

vbq::mm::mapping::~mapping (void) {
    unmap();
}

vbq::mm::mapping::mapping (mapping&& other) noexcept
    : addr{std::exchange(other.addr, nullptr)}, len{std::exchange(other.len, 0)} {
}

vbq::mm::mapping&
vbq::mm::mapping::operator= (mapping&& other) noexcept {

    if (this != &other) {
        unmap();
        addr = std::exchange(other.addr, nullptr);
        len  = std::exchange(other.len, 0);
    }

    return *this;
}

vbq::result<vbq::mm::mapping>
vbq::mm::mapping::map (const io::node& node, const u32 length, const u32 offset) noexcept {

    if (-1 == node.handle())
        return fail(errc::rejected, EBADF);

    void* addr = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, node.handle(), off_t(offset));

    if (MAP_FAILED == addr) {
        const i32 err = errno;
        std::fprintf(stderr, "[mmap] mapping of %u bytes at 0x%x failed %d:%s\n", length, offset, err, std::strerror(err));
        return fail(errc::rejected, err);
    }

    return mapping(addr, length);
}

void
vbq::mm::mapping::unmap (void) noexcept {

    if (nullptr == addr)
        return;

    if (-1 == ::munmap(addr, len))
        std::fprintf(stderr, "[mmap] unmap failed %d:%s\n", errno, std::strerror(errno));

    addr = nullptr;
    len  = 0;
}
