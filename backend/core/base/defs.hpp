#pragma once
#ifndef __VBQ_DEFINES_HPP__
#define __VBQ_DEFINES_HPP__ 1

#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace vbq
{
    using i08 = std::int8_t;
    using u08 = std::uint8_t;
    using i16 = std::int16_t;
    using u16 = std::uint16_t;
    using i32 = std::int32_t;
    using u32 = std::uint32_t;
    using i64 = std::int64_t;
    using u64 = std::uint64_t;
    using f32 = float;
    using f64 = double;

    // direction tags: who fills the buffer content
    struct output  final { static constexpr bool out {true};  static constexpr const char* name {"output"};  };
    struct capture final { static constexpr bool out {false}; static constexpr const char* name {"capture"}; };

    // values follow enum v4l2_memory
    enum struct memory : u32 {
        mmap    = 1,
        userptr = 2,
        dmabuf  = 4
    };

    enum struct errc : u08 {
        ok                = 0,
        rejected          = 1,  // driver refused the request, see status::os
        too_few_planes    = 2,
        too_many_planes   = 3,
        no_free_buffer    = 4,
        still_in_use      = 5,  // deallocation while streaming or with buffers out
        none_queued       = 6,
        would_block       = 7,
        already_allocated = 8,
        not_allocated     = 9,
        bad_index         = 10,
        bad_plane         = 11
    };

    struct status final {
        errc code {errc::ok};
        i32  os   {0};          // errno, only for errc::rejected

        explicit operator bool (void) const noexcept { return errc::ok == code; }
    };

    inline status fail (const errc code, const i32 os = 0) noexcept { return { code, os }; }

    const char* what (const errc)   noexcept ;
    const char* what (const status) noexcept ;

    // value or error, never both
    template <typename T>
    struct result final {
        status           stat {};
        std::optional<T> data {};

        result (T value)        noexcept : data{std::move(value)} {}
        result (const status s) noexcept : stat{s} {}

        explicit operator bool (void) const noexcept { return errc::ok == stat.code; }

        T&       operator*  (void)       noexcept { return *data; }
        const T& operator*  (void) const noexcept { return *data; }
        T*       operator-> (void)       noexcept { return &*data; }
        const T* operator-> (void) const noexcept { return &*data; }
    };

    // per plane: image size and line stride in bytes
    struct plane_fmt final {
        u32 sizeimage    {0};
        u32 bytesperline {0};
    };

    // negotiated elsewhere, consumed here to size buffers
    struct format final {
        u32                    width  {0};
        u32                    height {0};
        u32                    fourcc {0};
        std::vector<plane_fmt> planes {};
    };

    // V4L2_BUF_FLAG_*
    namespace flags {
        enum : u32 {
            mapped   = 0x00000001,
            queued   = 0x00000002,
            done     = 0x00000004,
            keyframe = 0x00000008,
            pframe   = 0x00000010,
            bframe   = 0x00000020,
            error    = 0x00000040,
            last     = 0x00100000
        };
    }

    // V4L2_BUF_CAP_SUPPORTS_*
    namespace caps {
        enum : u32 {
            mmap     = 1 << 0,
            userptr  = 1 << 1,
            dmabuf   = 1 << 2,
            requests = 1 << 3,
            orphaned = 1 << 4
        };
    }

    struct dqplane final {
        u32 length    {0};
        u32 bytesused {0};
        u32 offset    {0}; // data offset, multi-planar only
    };

    // everything the driver tells about a finished buffer
    struct dqbuffer final {
        u32                  index    {0};
        u32                  flags    {0};
        u32                  field    {0};
        u32                  sequence {0};
        i64                  sec      {0};
        i64                  usec     {0};
        std::vector<dqplane> planes   {};
    };

    // dequeue result shape that keeps nothing
    struct discard final {};
}

#endif
