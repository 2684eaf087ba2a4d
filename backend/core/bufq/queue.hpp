#ifndef __VBQ_QUEUE_HPP__
#define __VBQ_QUEUE_HPP__ 1

#include <cerrno>
#include <cstdio>
#include <memory>
#include <utility>
#include <variant>
#include <vector>
#include "defs.hpp"
#include "ioct.hpp"
#include "mems.hpp"
#include "qbuf.hpp"
#include "state.hpp"

namespace vbq
{
    // dequeue result shapes: what to keep from the driver's answer
    template <typename R> struct shape;

    template <> struct shape<discard> {
        static discard from (dqbuffer&&) noexcept { return {}; }
    };

    template <> struct shape<u32> {
        static u32 from (dqbuffer&& b) noexcept { return b.index; }
    };

    template <> struct shape<dqbuffer> {
        static dqbuffer from (dqbuffer&& b) noexcept { return std::move(b); }
    };

    // a finished buffer: the requested shape plus the backings it held
    template <typename R, typename M>
    struct dequeued final {
        R                                data   {};
        u32                              index  {0};
        std::vector<typename M::backing> planes {};
    };

    ////////////////////////////////////////////////////////////////
    //// One direction of a device, holding buffers of memory M.
    //// Unallocated: only allocate() reaches the driver.
    //// Allocated: count, format and memory fixed until deallocate(),
    //// which needs streaming off and every buffer back in the pool.
    ////////////////////////////////////////////////////////////////
    template <typename D, typename M>
    class queue final {
        static_assert(mm::is_memory_v<M>, "unknown memory strategy");

    public:
        using backing = typename M::backing;

        queue (io::node& node, const bool mplane) noexcept
            : dev{node}, kind{io::buftype(D::out, mplane)} {}

        ~queue (void) {

            if (streaming)
                static_cast<void>(stream_off());

            if (allocated() and 0 == std::get<ready>(phase).state->num_claimed())
                static_cast<void>(deallocate());
        }

        queue (const queue&)            = delete;
        queue& operator= (const queue&) = delete;

        result<u32> allocate (const u32 count, const format& fmt) noexcept {

            if (allocated()) {
                std::fprintf(stderr, "[queue] %s: buffers already allocated\n", D::name);
                return fail(errc::already_allocated);
            }

            if (0 == count)
                return u32(0);

            const std::size_t planes = io::is_mplane(kind) ? fmt.planes.size() : 1;

            if (0 == planes or planes > 8) {
                std::fprintf(stderr, "[queue] %s: format with %zu planes\n", D::name, planes);
                return fail(errc::rejected, EINVAL);
            }

            const result<io::reqinfo> req = io::reqbufs(dev, kind, M::kind, count);

            if (!req)
                return req.stat;

            if (0 == req->count)
                return u32(0);

            phase = ready { req->count, u32(planes), req->caps, fmt, std::make_shared<tracker<M>>(req->count) };

            return req->count;
        }

        status deallocate (void) noexcept {

            ready* r = std::get_if<ready>(&phase);

            if (nullptr == r)
                return fail(errc::not_allocated);

            if (streaming or 0 != r->state->num_queued() or 0 != r->state->num_claimed()) {
                std::fprintf(stderr, "[queue] %s: buffers still in use\n", D::name);
                return fail(errc::still_in_use);
            }

            const result<io::reqinfo> req = io::reqbufs(dev, kind, M::kind, 0);

            if (!req)
                return req.stat;

            phase = idle {};

            return {};
        }

        // the lowest free buffer
        result<qbuffer<D, M>> get_buffer (void) noexcept {

            ready* r = std::get_if<ready>(&phase);

            if (nullptr == r)
                return fail(errc::not_allocated);

            const result<u32> index = r->state->claim_first();

            if (!index)
                return index.stat;

            return build(*r, *index);
        }

        result<qbuffer<D, M>> get_buffer (const u32 index) noexcept {

            ready* r = std::get_if<ready>(&phase);

            if (nullptr == r)
                return fail(errc::not_allocated);

            const status stat = r->state->claim(index);

            if (!stat)
                return stat;

            return build(*r, index);
        }

        status stream_on (void) noexcept {

            if (!allocated())
                return fail(errc::not_allocated);

            const status stat = io::streamon(dev, kind);

            if (stat)
                streaming = true;

            return stat;
        }

        // the driver drops every queued buffer: they all come back here
        result<std::vector<released<M>>> stream_off (void) noexcept {

            ready* r = std::get_if<ready>(&phase);

            if (nullptr == r)
                return fail(errc::not_allocated);

            std::vector<released<M>> back {};
            back.reserve(r->state->count());

            const status stat = io::streamoff(dev, kind);

            if (!stat)
                return stat;

            streaming = false;

            r->state->sweep(back);

            return std::move(back);
        }

        // blocks until the driver hands a buffer back, unless the node is
        // non-blocking: then errc::would_block when none is ready
        template <typename R = dqbuffer>
        result<dequeued<R, M>> dequeue (void) noexcept {

            ready* r = std::get_if<ready>(&phase);

            if (nullptr == r)
                return fail(errc::not_allocated);

            if (0 == r->state->num_queued())
                return fail(errc::none_queued);

            result<dqbuffer> raw = io::dqbuf(dev, kind, M::kind);

            if (!raw)
                return raw.stat;

            const u32 index = raw->index;

            std::optional<std::vector<backing>> held = r->state->mark_free(index);

            if (!held) {
                std::fprintf(stderr, "[queue] %s: driver returned buffer %u which was not queued\n", D::name, index);
                return fail(errc::bad_index);
            }

            return dequeued<R, M> { shape<R>::from(std::move(*raw)), index, std::move(*held) };
        }

        bool allocated   (void) const noexcept { return std::holds_alternative<ready>(phase); }
        bool is_streaming(void) const noexcept { return streaming; }
        u32  type        (void) const noexcept { return kind; }
        bool mplane      (void) const noexcept { return io::is_mplane(kind); }

        io::node& node (void) const noexcept { return dev; }

        u32 count (void) const noexcept {
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->count : 0;
        }

        u32 num_planes (void) const noexcept {
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->planes : 0;
        }

        u32 caps (void) const noexcept {
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->caps : 0;
        }

        u32 num_queued (void) const noexcept {
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->state->num_queued() : 0;
        }

        u32 num_free (void) const noexcept {
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->state->num_free() : 0;
        }

        slot state (const u32 index) const noexcept {
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->state->state(index) : slot::free;
        }

        // empty while unallocated
        const format& fmt (void) const noexcept {
            static const format none {};
            const ready* r = std::get_if<ready>(&phase);
            return r ? r->fmt : none;
        }

    private:
        struct idle final {};

        struct ready final {
            u32                         count  {0};
            u32                         planes {0};
            u32                         caps   {0};
            format                      fmt    {};
            std::shared_ptr<tracker<M>> state  {};
        };

        qbuffer<D, M> build (ready& r, const u32 index) noexcept {
            return qbuffer<D, M>(dev, kind, index, r.planes, fuse<M>(r.state, index));
        }

        io::node&                 dev;
        u32                       kind      {0};
        bool                      streaming {false};
        std::variant<idle, ready> phase     {};
    };

    template <typename M> using output_queue  = queue<output,  M>;
    template <typename M> using capture_queue = queue<capture, M>;
}

#endif
