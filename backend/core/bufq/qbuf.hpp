#ifndef __VBQ_QUEUE_BUFFER_HPP__
#define __VBQ_QUEUE_BUFFER_HPP__ 1

#include <cstdio>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>
#include "defs.hpp"
#include "ioct.hpp"
#include "mems.hpp"
#include "mmap.hpp"
#include "state.hpp"

namespace vbq
{
    template <typename D, typename M> class qbuffer;

    // outcome of a submission; on failure the backings come back
    template <typename M>
    struct queue_status final {
        status                           stat   {};
        std::vector<typename M::backing> planes {};

        explicit operator bool (void) const noexcept { return errc::ok == stat.code; }
    };

    // one plane about to be queued.
    // capture planes only need a backing for the driver to write into,
    // output planes also say how many bytes of it are used
    template <typename D, typename M>
    class plane final {
    public:
        using backing = typename M::backing;

        static plane cap (backing b) noexcept {
            static_assert(!D::out, "capture planes belong to capture queues");
            return plane(std::move(b), 0);
        }

        static plane out (backing b, const u32 bytes_used) noexcept {
            static_assert(D::out, "output planes belong to output queues");
            return plane(std::move(b), bytes_used);
        }

        // where the payload starts, multi-planar only
        plane offset (const u32 data_offset) && noexcept {
            static_assert(D::out, "data offset is set by the driver on capture queues");
            desc.offset = data_offset;
            return std::move(*this);
        }

    private:
        // the handle may point into `back`, which stays with the builder
        // and then the tracker until the buffer is dequeued
        plane (backing b, const u32 bytes_used) noexcept : back{std::move(b)} {
            M::make(mm::unsafe, back).fill(desc);
            desc.bytesused = bytes_used;
        }

        backing    back {};
        io::qplane desc {};

        friend class qbuffer<D, M>;
    };

    // a claimed buffer being described before submission.
    // every step consumes the builder, use it as
    //     std::move(b).add_plane(...).add_plane(...).submit()
    // dropping it unsubmitted returns the index to the free pool.
    // a builder must not outlive the queue that issued it
    template <typename D, typename M>
    class qbuffer final {
    public:
        using backing = typename M::backing;

        qbuffer (io::node& node, const u32 type, const u32 index, const u32 expected, fuse<M> guard) noexcept
            : node{&node}, type{type}, expected{expected}, guard{std::move(guard)} {
            desc.index = index;
            desc.mem   = M::kind;
        }

        qbuffer (qbuffer&&) noexcept = default;

        qbuffer (const qbuffer&)            = delete;
        qbuffer& operator= (const qbuffer&) = delete;
        qbuffer& operator= (qbuffer&&)      = delete;

        u32 index               (void) const noexcept { return desc.index; }
        u32 num_expected_planes (void) const noexcept { return expected; }
        u32 num_set_planes      (void) const noexcept { return u32(desc.planes.size()); }

        qbuffer add_plane (plane<D, M> p) && noexcept {
            push(std::move(p));
            return std::move(*this);
        }

        // V4L2_BUF_FLAG_* passed with the buffer, e.g. flags::last on output
        qbuffer set_flags (const u32 bits) && noexcept {
            desc.flags = bits;
            return std::move(*this);
        }

        // the slot is committed as queued before QBUF so a dequeue on another
        // thread finds it as soon as the driver can complete it; a refused
        // QBUF takes the backings back out of the slot
        queue_status<M> submit (void) && noexcept {

            const std::size_t count = desc.planes.size();

            if (count != expected) {
                guard.blow();
                return { fail(count < expected ? errc::too_few_planes : errc::too_many_planes), std::move(held) };
            }

            if (!usable()) {
                std::fprintf(stderr, "[qbuf] buffer %u: empty or oversized plane\n", desc.index);
                guard.blow();
                return { fail(errc::bad_plane), std::move(held) };
            }

            tracker<M>& state = guard.state();

            state.mark_queued(desc.index, std::move(held));
            guard.disarm();

            const status stat = io::qbuf(*node, type, desc);

            if (!stat) {
                // empty when a stream-off swept the slot meanwhile, the
                // backings went out with the sweep then
                std::optional<std::vector<backing>> back = state.mark_free(desc.index);
                return { stat, back ? std::move(*back) : std::vector<backing>{} };
            }

            return {};
        }

        // mmap capture buffers need no caller data: add the empty planes and submit
        queue_status<M> auto_fill (void) && noexcept {
            static_assert(std::is_same_v<D, capture> and std::is_same_v<M, mm::mmap>,
                          "auto_fill is for mmap capture buffers");

            while (desc.planes.size() < expected)
                push(plane<D, M>::cap(mm::none{}));

            return std::move(*this).submit();
        }

    private:
        // user pointers need an address and a length the driver can take
        bool usable (void) const noexcept {
            if constexpr (memory::userptr == M::kind) {
                for (const io::qplane& p : desc.planes)
                    if (0 == p.userptr or 0 == p.length)
                        return false;
            }
            return true;
        }

        void push (plane<D, M>&& p) noexcept {
            desc.planes.push_back(p.desc);
            held.push_back(std::move(p.back));
        }

        io::node*            node     {nullptr};
        u32                  type     {0};
        u32                  expected {0};
        io::qdesc            desc     {};
        std::vector<backing> held     {};
        fuse<M>              guard;
    };
}

#endif
