#ifndef __VBQ_IOCTL_TRANSPORT_HPP__
#define __VBQ_IOCTL_TRANSPORT_HPP__ 1

#include <vector>
#include "defs.hpp"
#include "node.hpp"

namespace vbq::io
{
    // answer of VIDIOC_REQBUFS
    struct reqinfo final {
        u32 count {0};
        u32 caps  {0}; // vbq::caps bits
    };

    // one plane as handed to VIDIOC_QBUF, filled by the memory handles
    struct qplane final {
        u32           bytesused {0};
        u32           offset    {0}; // data offset, multi-planar only
        u32           length    {0};
        unsigned long userptr   {0};
    };

    struct qdesc final {
        u32                 index  {0};
        memory              mem    {memory::mmap};
        u32                 flags  {0};
        u32                 field  {0};
        std::vector<qplane> planes {};
    };

    struct qinfo final {
        struct plane final {
            u32 length {0};
            u32 offset {0}; // mmap offset
        };

        u32                index  {0};
        u32                flags  {0};
        std::vector<plane> planes {};
    };

    u32  buftype   (const bool out, const bool mplane) noexcept ; // enum v4l2_buf_type
    bool is_mplane (const u32 type) noexcept ;

    result<reqinfo>  reqbufs   (node&, const u32 type, const memory, const u32 count) noexcept ;
    status           qbuf      (node&, const u32 type, const qdesc&) noexcept ;
    result<dqbuffer> dqbuf     (node&, const u32 type, const memory) noexcept ;
    status           streamon  (node&, const u32 type) noexcept ;
    status           streamoff (node&, const u32 type) noexcept ;
    result<qinfo>    querybuf  (node&, const u32 type, const memory, const u32 index) noexcept ;

    // true when the driver speaks the multi-planar API for this direction
    result<bool>     probe     (node&, const bool out) noexcept ;
}

#endif
