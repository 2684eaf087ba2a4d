#ifndef __VBQ_MEMORY_MMAP_HPP__
#define __VBQ_MEMORY_MMAP_HPP__ 1

#include <cstddef>
#include "mems.hpp"

namespace vbq::mm
{
    // driver-owned memory: the driver knows where the plane lives
    struct mmap_handle final {
        void fill (io::qplane&) const noexcept {}
    };

    struct mmap final {
        static constexpr memory kind {memory::mmap};

        using backing = none;
        using handle  = mmap_handle;

        static handle make (unsafe_t, const backing&) noexcept { return {}; }
    };

    template <>
    struct is_memory<mmap> : std::true_type {};

    // one plane of a mmap buffer mapped into this process
    class mapping final {
    public:
        mapping (void) noexcept = default;
        ~mapping (void);

        mapping (mapping&&) noexcept ;
        mapping& operator= (mapping&&) noexcept ;

        mapping (const mapping&)            = delete;
        mapping& operator= (const mapping&) = delete;

        // offset and length come from io::querybuf
        static result<mapping> map (const io::node&, const u32 length, const u32 offset) noexcept ;

        const u08*  data (void) const noexcept { return static_cast<const u08*>(addr); }
        u08*        data (void)       noexcept { return static_cast<u08*>(addr); }
        std::size_t size (void) const noexcept { return len; }

    private:
        mapping (void*, const std::size_t) noexcept ;

        void        unmap (void) noexcept ;

        void*       addr {nullptr};
        std::size_t len  {0};
    };
}

#endif
