#include <gtest/gtest.h>
#include <array>
#include <cerrno>
#include <memory>
#include <string>
#include <vector>

#include "mocks/FakeVideoNode.hpp"
#include "mmap.hpp"
#include "uptr.hpp"

using namespace vbq;
using vbq::tests::FakeVideoNode;

namespace {

using Bytes  = std::vector<u08>;
using Shared = std::shared_ptr<Bytes>;

static_assert(mm::is_memory_v<mm::mmap>);
static_assert(mm::is_memory_v<mm::uptr<Bytes>>);
static_assert(mm::is_memory_v<mm::uptr<Shared>>);
static_assert(mm::is_memory_v<mm::uptr<mm::region>>);
static_assert(!mm::is_memory_v<int>);
static_assert(!mm::is_memory_v<Bytes>);

static_assert(!mm::stable<std::string>::value, "small strings keep their bytes inline");
static_assert(!mm::stable<std::array<u08, 16>>::value);

} // namespace

TEST(UserPtrHandle, FillsAddressAndLength) {
    Bytes buf(300);
    const mm::uptr_handle h(mm::unsafe, buf.data(), buf.size());

    io::qplane plane {};
    plane.bytesused = 17;
    h.fill(plane);

    EXPECT_EQ(plane.userptr, reinterpret_cast<unsigned long>(buf.data()));
    EXPECT_EQ(plane.length, 300u);
    EXPECT_EQ(plane.bytesused, 17u) << "fill leaves the payload size to the caller";
    EXPECT_EQ(h.address(), plane.userptr);
    EXPECT_EQ(h.length(), 300u);
}

TEST(UserPtrHandle, MakeFromVectorSurvivesMove) {
    Bytes buf(64, 9);
    const u08* where = buf.data();

    const auto before = mm::uptr<Bytes>::make(mm::unsafe, buf);
    Bytes moved(std::move(buf));
    const auto after = mm::uptr<Bytes>::make(mm::unsafe, moved);

    EXPECT_EQ(before.address(), reinterpret_cast<unsigned long>(where));
    EXPECT_EQ(after.address(), before.address());
    EXPECT_EQ(after.length(), 64u);
}

TEST(UserPtrHandle, RegionDescribesCallerMemory) {
    alignas(64) static u08 storage[512];
    const mm::region r(mm::unsafe, storage, sizeof(storage));

    const auto h = mm::uptr<mm::region>::make(mm::unsafe, r);
    EXPECT_EQ(h.address(), reinterpret_cast<unsigned long>(&storage[0]));
    EXPECT_EQ(h.length(), 512u);
}

// V4L2 plane lengths are 32 bit: nothing is truncated, the handle is left empty.
TEST(UserPtrHandle, FourGiBAndOverGivesEmptyHandle) {
    alignas(64) static u08 storage[64];
    const std::size_t huge = std::size_t(1) << 32;

    const mm::uptr_handle over(mm::unsafe, storage, huge);
    EXPECT_EQ(over.address(), 0ul);
    EXPECT_EQ(over.length(), 0u);

    const mm::uptr_handle edge(mm::unsafe, storage, mm::uptr_handle::max_size);
    EXPECT_EQ(edge.address(), reinterpret_cast<unsigned long>(&storage[0]));
    EXPECT_EQ(edge.length(), 0xFFFFFFFFu);

    io::qplane plane {};
    mm::uptr<mm::region>::make(mm::unsafe, mm::region(mm::unsafe, storage, huge)).fill(plane);
    EXPECT_EQ(plane.userptr, 0ul);
    EXPECT_EQ(plane.length, 0u);
}

TEST(UserPtrHandle, EmptySharedBackingHasNoAddress) {
    const Shared empty;
    const auto h = mm::uptr<Shared>::make(mm::unsafe, empty);
    EXPECT_EQ(h.address(), 0ul);
    EXPECT_EQ(h.length(), 0u);

    const Shared some = std::make_shared<Bytes>(32);
    EXPECT_EQ(mm::uptr<Shared>::make(mm::unsafe, some).address(), reinterpret_cast<unsigned long>(some->data()));
}

TEST(MmapHandle, LeavesPlaneUntouched) {
    io::qplane plane {};
    plane.bytesused = 5;
    mm::mmap::make(mm::unsafe, mm::none{}).fill(plane);

    EXPECT_EQ(plane.userptr, 0ul);
    EXPECT_EQ(plane.length, 0u);
    EXPECT_EQ(plane.bytesused, 5u);
}

TEST(Mapping, NeedsADeviceDescriptor) {
    FakeVideoNode fake;
    const auto m = mm::mapping::map(fake, 4096, 0);
    EXPECT_EQ(m.stat.code, errc::rejected);
    EXPECT_EQ(m.stat.os, EBADF);
}

TEST(Mapping, DefaultIsEmpty) {
    mm::mapping m;
    EXPECT_EQ(m.data(), nullptr);
    EXPECT_EQ(m.size(), 0u);

    mm::mapping other(std::move(m));
    EXPECT_EQ(other.size(), 0u);
}
