#ifndef __VBQ_BUFFER_STATE_HPP__
#define __VBQ_BUFFER_STATE_HPP__ 1

#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>
#include "defs.hpp"

namespace vbq
{
    // free    -> claimed : get_buffer
    // claimed -> free    : builder dropped or submission failed
    // claimed -> queued  : submission, just before QBUF
    // queued  -> free    : dequeue, stream-off, or QBUF refused
    enum struct slot : u08 {
        free    = 0,
        claimed = 1, // a builder is bound to it, still not queued
        queued  = 2
    };

    // a buffer given back by stream-off, with the backings it held
    template <typename M>
    struct released final {
        u32                              index  {0};
        std::vector<typename M::backing> planes {};
    };

    // state of every buffer of an allocated queue.
    // shared by the queue and the fuses of its live builders; every call
    // takes the lock and none of them talks to the driver
    template <typename M>
    class tracker final {
    public:
        using planes = std::vector<typename M::backing>;

        explicit tracker (const u32 count) : slots(count) {}

        tracker (const tracker&)            = delete;
        tracker& operator= (const tracker&) = delete;

        status claim (const u32 index) noexcept {
            std::lock_guard<std::mutex> guard {lock};

            if (index >= slots.size())
                return fail(errc::bad_index);

            if (slot::free != slots[index].state)
                return fail(errc::no_free_buffer);

            slots[index].state = slot::claimed;

            return {};
        }

        // lowest free index
        result<u32> claim_first (void) noexcept {
            std::lock_guard<std::mutex> guard {lock};

            for (u32 i = 0; i < slots.size(); ++i) {
                if (slot::free == slots[i].state) {
                    slots[i].state = slot::claimed;
                    return i;
                }
            }

            return fail(errc::no_free_buffer);
        }

        // claimed -> free, anything else untouched
        void release (const u32 index) noexcept {
            std::lock_guard<std::mutex> guard {lock};

            if (index < slots.size() and slot::claimed == slots[index].state)
                slots[index].state = slot::free;
        }

        void mark_queued (const u32 index, planes held) noexcept {
            std::lock_guard<std::mutex> guard {lock};

            if (index >= slots.size())
                return;

            if (slot::queued != slots[index].state)
                ++queued;

            slots[index].state = slot::queued;
            slots[index].held  = std::move(held);
        }

        // queued -> free, hands back what the slot held.
        // nothing when the slot was not queued
        std::optional<planes> mark_free (const u32 index) noexcept {
            std::lock_guard<std::mutex> guard {lock};

            if (index >= slots.size() or slot::queued != slots[index].state)
                return std::nullopt;

            --queued;

            slots[index].state = slot::free;

            return std::exchange(slots[index].held, planes{});
        }

        // every queued slot back to free, in index order, appended to `out`.
        // `out` must have room for count() more entries so that nothing
        // allocates under the lock
        void sweep (std::vector<released<M>>& out) noexcept {
            std::lock_guard<std::mutex> guard {lock};

            for (u32 i = 0; i < slots.size(); ++i) {
                if (slot::queued == slots[i].state) {
                    slots[i].state = slot::free;
                    out.push_back({ i, std::exchange(slots[i].held, planes{}) });
                }
            }

            queued = 0;
        }

        slot state (const u32 index) const noexcept {
            std::lock_guard<std::mutex> guard {lock};
            return index < slots.size() ? slots[index].state : slot::free;
        }

        u32 num_queued (void) const noexcept {
            std::lock_guard<std::mutex> guard {lock};
            return queued;
        }

        u32 num_free (void) const noexcept { return count_of(slot::free); }

        u32 num_claimed (void) const noexcept { return count_of(slot::claimed); }

        u32 count (void) const noexcept { return u32(slots.size()); }

    private:
        struct entry final {
            slot   state {slot::free};
            planes held  {};
        };

        u32 count_of (const slot which) const noexcept {
            std::lock_guard<std::mutex> guard {lock};
            u32 n {0};
            for (const entry& e : slots)
                if (which == e.state) ++n;
            return n;
        }

        mutable std::mutex lock   {};
        std::vector<entry> slots  {};
        u32                queued {0};
    };

    // single-use guard over one claimed index: unless disarmed, the index
    // goes back to free when the guard dies
    template <typename M>
    class fuse final {
    public:
        fuse (std::shared_ptr<tracker<M>> owner, const u32 index) noexcept
            : owner{std::move(owner)}, index{index} {}

        ~fuse (void) { blow(); }

        fuse (fuse&& other) noexcept
            : owner{std::move(other.owner)}, index{other.index}, lit{std::exchange(other.lit, false)} {}

        fuse (const fuse&)             = delete;
        fuse& operator= (const fuse&)  = delete;
        fuse& operator= (fuse&&)       = delete;

        void disarm (void) noexcept { lit = false; }

        // release the index now instead of at destruction
        void blow (void) noexcept {
            if (lit and owner)
                owner->release(index);
            lit = false;
        }

        bool armed (void) const noexcept { return lit; }

        tracker<M>& state (void) const noexcept { return *owner; }

    private:
        std::shared_ptr<tracker<M>> owner {};
        u32                         index {0};
        bool                        lit   {true};
    };
}

#endif
