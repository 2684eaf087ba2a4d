#ifndef __VBQ_MEMORY_HPP__
#define __VBQ_MEMORY_HPP__ 1

#include <type_traits>
#include "defs.hpp"
#include "ioct.hpp"

////////////////////////////////////////////////////////////////
//// Memory strategies are policy classes with:
////   kind     vbq::memory value passed to the driver
////   backing  what the caller hands over per plane, held by the
////            queue while the buffer is queued and given back on
////            dequeue or stream-off
////   handle   built from a backing, fills an io::qplane
////   make     builds the handle; unsafe because the handle may
////            point into the backing
//// The set is closed by is_memory. A dmabuf strategy would be a
//// third policy next to mmap and uptr.
////////////////////////////////////////////////////////////////

namespace vbq::mm
{
    // acknowledges a lifetime contract the compiler cannot check
    struct unsafe_t final { explicit unsafe_t (void) = default; };
    inline constexpr unsafe_t unsafe {};

    // backing of driver-owned memory
    struct none final {};

    template <typename M>
    struct is_memory : std::false_type {};

    template <typename M>
    inline constexpr bool is_memory_v = is_memory<M>::value;
}

#endif
