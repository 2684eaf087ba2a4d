#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <linux/videodev2.h>
#include <atomic>
#include <cerrno>
#include <memory>
#include <thread>
#include <vector>

#include "mocks/MockVideoNode.hpp"
#include "queue.hpp"
#include "uptr.hpp"

using namespace vbq;
using vbq::tests::FakeVideoNode;
using vbq::tests::MockVideoNode;
using ::testing::_;
using ::testing::AnyNumber;
using ::testing::NiceMock;

namespace {

using Bytes = std::vector<u08>;

format Planes(u32 count, u32 size = 4096) {
    format fmt;
    fmt.width  = 64;
    fmt.height = 48;
    for (u32 i = 0; i < count; ++i) {
        fmt.planes.push_back({size, 64});
    }
    return fmt;
}

} // namespace

// Two mmap capture buffers, the device finishes buffer 0 with 1024 bytes.
TEST(Dequeue, MmapCaptureScenario) {
    FakeVideoNode fake;
    queue<capture, mm::mmap> q(fake, false);

    ASSERT_EQ(*q.allocate(2, Planes(1)), 2u);
    ASSERT_TRUE(q.stream_on());

    for (int i = 0; i < 2; ++i) {
        auto b = q.get_buffer();
        ASSERT_TRUE(b);
        ASSERT_TRUE(std::move(*b).auto_fill());
    }
    EXPECT_EQ(q.num_queued(), 2u);

    ASSERT_TRUE(fake.Complete(fake.CaptureType(), 0, {1024}));

    auto res = q.dequeue();
    ASSERT_TRUE(res) << what(res.stat);
    EXPECT_EQ(res->index, 0u);
    EXPECT_EQ(res->data.index, 0u);
    ASSERT_EQ(res->data.planes.size(), 1u);
    EXPECT_EQ(res->data.planes[0].bytesused, 1024u);
    EXPECT_TRUE(res->data.flags & flags::done);
    EXPECT_EQ(res->planes.size(), 1u);

    EXPECT_EQ(q.state(0), slot::free);
    EXPECT_EQ(q.state(1), slot::queued);
    EXPECT_EQ(q.num_queued(), 1u);
}

TEST(Dequeue, NothingQueuedFailsWithoutKernelCall) {
    FakeVideoNode fake;
    NiceMock<MockVideoNode> node(fake);
    EXPECT_CALL(node, ioctl(_, _)).Times(AnyNumber());
    EXPECT_CALL(node, ioctl(VIDIOC_DQBUF, _)).Times(0);

    queue<capture, mm::mmap> q(node, false);
    ASSERT_TRUE(q.allocate(2, Planes(1)));
    ASSERT_TRUE(q.stream_on());

    const auto res = q.dequeue();
    EXPECT_EQ(res.stat.code, errc::none_queued);
}

TEST(Dequeue, NonBlockingNodeReportsWouldBlock) {
    FakeVideoNode fake;
    queue<capture, mm::mmap> q(fake, false);
    ASSERT_TRUE(q.allocate(1, Planes(1)));
    ASSERT_TRUE(q.stream_on());
    auto b = q.get_buffer();
    ASSERT_TRUE(std::move(*b).auto_fill());

    const auto res = q.dequeue<discard>();
    EXPECT_EQ(res.stat.code, errc::would_block);
    EXPECT_EQ(q.state(0), slot::queued) << "nothing changes when nothing is ready";

    fake.CompleteAll(fake.CaptureType());
    EXPECT_TRUE(q.dequeue<discard>());
    EXPECT_EQ(q.state(0), slot::free);
}

// The very object queued comes back, untouched, and the device saw its address.
TEST(Dequeue, UserPtrRoundTripReturnsSameBacking) {
    FakeVideoNode fake(true, 2);
    queue<output, mm::uptr<Bytes>> q(fake, true);
    ASSERT_EQ(*q.allocate(1, Planes(2, 256)), 1u);
    ASSERT_TRUE(q.stream_on());

    Bytes luma(256, 0x11);
    Bytes chroma(128, 0x22);
    const u08* lumaData   = luma.data();
    const u08* chromaData = chroma.data();

    auto b = q.get_buffer();
    ASSERT_TRUE(b);
    auto sent = std::move(*b)
                    .add_plane(plane<output, mm::uptr<Bytes>>::out(std::move(luma), 200))
                    .add_plane(plane<output, mm::uptr<Bytes>>::out(std::move(chroma), 100).offset(8))
                    .submit();
    ASSERT_TRUE(sent) << what(sent.stat);

    const auto seen = fake.Snapshot(fake.OutputType()).buffers[0];
    EXPECT_EQ(seen.planes[0].userptr, reinterpret_cast<unsigned long>(lumaData));
    EXPECT_EQ(seen.planes[0].length, 256u);
    EXPECT_EQ(seen.planes[1].userptr, reinterpret_cast<unsigned long>(chromaData));

    ASSERT_TRUE(fake.Complete(fake.OutputType(), 0));

    auto res = q.dequeue();
    ASSERT_TRUE(res);
    ASSERT_EQ(res->data.planes.size(), 2u);
    EXPECT_EQ(res->data.planes[0].bytesused, 200u);
    EXPECT_EQ(res->data.planes[1].bytesused, 100u);
    EXPECT_EQ(res->data.planes[1].offset, 8u);

    ASSERT_EQ(res->planes.size(), 2u);
    EXPECT_EQ(res->planes[0].data(), lumaData);
    EXPECT_EQ(res->planes[1].data(), chromaData);
    EXPECT_EQ(res->planes[0], Bytes(256, 0x11));
    EXPECT_EQ(res->planes[1], Bytes(128, 0x22));
}

TEST(Dequeue, SharedBackingKeepsIdentity) {
    using Shared = std::shared_ptr<Bytes>;
    FakeVideoNode fake;
    queue<output, mm::uptr<Shared>> q(fake, false);
    ASSERT_TRUE(q.allocate(2, Planes(1)));
    ASSERT_TRUE(q.stream_on());

    auto frame = std::make_shared<Bytes>(512, 0);
    Bytes* identity = frame.get();

    auto b = q.get_buffer();
    ASSERT_TRUE(std::move(*b).add_plane(plane<output, mm::uptr<Shared>>::out(std::move(frame), 512)).submit());
    ASSERT_TRUE(fake.Complete(fake.OutputType(), 0));

    auto res = q.dequeue<u32>();
    ASSERT_TRUE(res);
    EXPECT_EQ(res->data, 0u);
    ASSERT_EQ(res->planes.size(), 1u);
    EXPECT_EQ(res->planes[0].get(), identity);
    EXPECT_EQ(res->planes[0].use_count(), 1);
}

TEST(Dequeue, DriverErrorIsSurfaced) {
    FakeVideoNode fake;
    queue<capture, mm::mmap> q(fake, false);
    ASSERT_TRUE(q.allocate(1, Planes(1)));
    auto b = q.get_buffer();
    ASSERT_TRUE(std::move(*b).auto_fill());

    // not streaming: the device refuses DQBUF
    const auto res = q.dequeue();
    EXPECT_EQ(res.stat.code, errc::rejected);
    EXPECT_EQ(res.stat.os, EINVAL);
    EXPECT_EQ(q.num_queued(), 1u);
}

// A driver answering with an index we never queued is reported, not trusted.
TEST(Dequeue, UnknownIndexFromDriverIsReported) {
    FakeVideoNode fake;
    NiceMock<MockVideoNode> node(fake);
    EXPECT_CALL(node, ioctl(_, _)).Times(AnyNumber());

    queue<capture, mm::mmap> q(node, false);
    ASSERT_TRUE(q.allocate(2, Planes(1)));
    ASSERT_TRUE(q.stream_on());
    auto b = q.get_buffer(0);
    ASSERT_TRUE(std::move(*b).auto_fill());

    EXPECT_CALL(node, ioctl(VIDIOC_DQBUF, _)).WillOnce([](unsigned long, void* arg) {
        static_cast<v4l2_buffer*>(arg)->index = 1;
        return 0;
    });

    const auto res = q.dequeue();
    EXPECT_EQ(res.stat.code, errc::bad_index);
    EXPECT_EQ(q.state(0), slot::queued);
    EXPECT_EQ(q.num_queued(), 1u);
}

// One thread queues, another dequeues; the tracker stays consistent.
TEST(Dequeue, ConcurrentSubmitAndDequeue) {
    constexpr int kFrames = 200;
    FakeVideoNode fake;
    queue<capture, mm::mmap> q(fake, false);
    ASSERT_EQ(*q.allocate(4, Planes(1)), 4u);
    ASSERT_TRUE(q.stream_on());

    std::atomic<int> queued{0};
    std::atomic<int> dequeued{0};

    std::thread producer([&] {
        while (queued.load() < kFrames) {
            auto b = q.get_buffer();
            if (!b) {
                std::this_thread::yield();
                continue;
            }
            if (std::move(*b).auto_fill()) {
                ++queued;
            }
        }
    });

    std::thread device([&] {
        while (dequeued.load() < kFrames) {
            fake.CompleteAll(fake.CaptureType(), 64);
            std::this_thread::yield();
        }
    });

    while (dequeued.load() < kFrames) {
        auto res = q.dequeue<discard>();
        if (res) {
            ++dequeued;
        } else {
            EXPECT_TRUE(res.stat.code == errc::would_block || res.stat.code == errc::none_queued);
            std::this_thread::yield();
        }
    }

    producer.join();
    device.join();

    EXPECT_EQ(q.num_queued() + q.num_free(), 4u);
    EXPECT_EQ(queued.load() - dequeued.load(), int(q.num_queued()));
}

// The driver may finish a buffer before QBUF has even returned to the
// submitter; a dequeue in that window must already find it queued.
TEST(Dequeue, BufferFinishedBeforeSubmitReturns) {
    FakeVideoNode fake;
    NiceMock<MockVideoNode> node(fake);
    EXPECT_CALL(node, ioctl(_, _)).Times(AnyNumber());

    queue<capture, mm::mmap> q(node, false);
    ASSERT_EQ(*q.allocate(2, Planes(1)), 2u);
    ASSERT_TRUE(q.stream_on());

    errc seen = errc::rejected;
    EXPECT_CALL(node, ioctl(VIDIOC_QBUF, _)).WillOnce([&](unsigned long request, void* arg) {
        const i32 err = fake.ioctl(request, arg);
        EXPECT_TRUE(fake.Complete(fake.CaptureType(), 0, {512}));
        seen = q.dequeue<discard>().stat.code;
        return err;
    });

    auto b = q.get_buffer(0);
    ASSERT_TRUE(b);
    const auto res = std::move(*b).auto_fill();

    ASSERT_TRUE(res) << what(res.stat);
    EXPECT_EQ(seen, errc::ok);
    EXPECT_EQ(q.state(0), slot::free);
    EXPECT_EQ(q.num_queued(), 0u);
    EXPECT_FALSE(fake.Snapshot(fake.CaptureType()).buffers[0].queued);
}

// A stream-off racing a refused QBUF hands the backing out exactly once,
// through the stream-off.
TEST(Dequeue, StreamOffDuringRefusedSubmitKeepsBackingOnce) {
    FakeVideoNode fake;
    NiceMock<MockVideoNode> node(fake);
    using Shared = std::shared_ptr<Bytes>;
    EXPECT_CALL(node, ioctl(_, _)).Times(AnyNumber());

    queue<output, mm::uptr<Shared>> q(node, false);
    ASSERT_TRUE(q.allocate(1, Planes(1)));
    ASSERT_TRUE(q.stream_on());

    std::vector<released<mm::uptr<Shared>>> swept;
    EXPECT_CALL(node, ioctl(VIDIOC_QBUF, _)).WillOnce([&](unsigned long, void*) {
        auto off = q.stream_off();
        EXPECT_TRUE(off);
        if (off) {
            swept = std::move(*off);
        }
        return EIO;
    });

    auto frame = std::make_shared<Bytes>(4096);
    auto b = q.get_buffer();
    ASSERT_TRUE(b);
    const auto res = std::move(*b).add_plane(plane<output, mm::uptr<Shared>>::out(frame, 4096)).submit();

    EXPECT_EQ(res.stat.code, errc::rejected);
    EXPECT_EQ(res.stat.os, EIO);
    EXPECT_TRUE(res.planes.empty());
    ASSERT_EQ(swept.size(), 1u);
    ASSERT_EQ(swept[0].planes.size(), 1u);
    EXPECT_EQ(swept[0].planes[0].get(), frame.get());
    EXPECT_EQ(q.state(0), slot::free);
    EXPECT_EQ(q.num_queued(), 0u);
}
