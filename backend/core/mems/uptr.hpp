#ifndef __VBQ_MEMORY_USERPTR_HPP__
#define __VBQ_MEMORY_USERPTR_HPP__ 1

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>
#include "mems.hpp"

namespace vbq::mm
{
    // address and length of caller-owned memory.
    // the memory must stay valid and in place until the buffer using the
    // handle is dequeued or the queue streamed off.
    // v4l2 plane lengths are 32 bit: memory of 4 GiB and over gives an
    // empty handle, which submit refuses
    class uptr_handle final {
    public:
        static constexpr std::size_t max_size {UINT32_MAX};

        uptr_handle (unsafe_t, const void* data, const std::size_t size) noexcept {
            if (size > max_size)
                return;
            addr = reinterpret_cast<unsigned long>(data);
            len  = u32(size);
        }

        void fill (io::qplane& plane) const noexcept {
            plane.userptr = addr;
            plane.length  = len;
        }

        unsigned long address (void) const noexcept { return addr; }
        u32           length  (void) const noexcept { return len;  }

    private:
        unsigned long addr {0};
        u32           len  {0};
    };

    // raw memory the caller owns and keeps alive, see uptr_handle
    class region final {
    public:
        region (unsafe_t, void* data, const std::size_t size) noexcept : ptr{data}, len{size} {}

        void*       data (void) const noexcept { return ptr; }
        std::size_t size (void) const noexcept { return len; }

    private:
        void*       ptr {nullptr};
        std::size_t len {0};
    };

    struct bytes final {
        const void* data {nullptr};
        std::size_t size {0};
    };

    inline bytes view (const std::vector<u08>& v) noexcept { return { v.data(), v.size() }; }
    inline bytes view (const region& r)           noexcept { return { r.data(), r.size() }; }
    inline bytes view (const std::shared_ptr<std::vector<u08>>& v) noexcept {
        return v ? bytes{ v->data(), v->size() } : bytes{};
    }

    // backings whose bytes do not move when the object itself is moved
    template <typename T> struct stable : std::false_type {};
    template <> struct stable<std::vector<u08>>                  : std::true_type {};
    template <> struct stable<std::shared_ptr<std::vector<u08>>> : std::true_type {};
    template <> struct stable<region>                            : std::true_type {};

    // the queue takes the backing object while the buffer is queued and
    // returns that very object on dequeue or stream-off
    template <typename T>
    struct uptr final {
        static_assert(stable<T>::value, "user pointer backing must keep its bytes in place when moved");

        static constexpr memory kind {memory::userptr};

        using backing = T;
        using handle  = uptr_handle;

        static handle make (unsafe_t tag, const backing& b) noexcept {
            const bytes span = view(b);
            return { tag, span.data, span.size };
        }
    };

    template <typename T>
    struct is_memory<uptr<T>> : std::true_type {};
}

#endif
