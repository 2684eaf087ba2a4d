#include <linux/videodev2.h>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <algorithm>
#include "ioct.hpp"

static_assert(V4L2_MEMORY_MMAP    == vbq::u32(vbq::memory::mmap));
static_assert(V4L2_MEMORY_USERPTR == vbq::u32(vbq::memory::userptr));
static_assert(V4L2_MEMORY_DMABUF  == vbq::u32(vbq::memory::dmabuf));

static_assert(V4L2_BUF_FLAG_MAPPED   == vbq::flags::mapped);
static_assert(V4L2_BUF_FLAG_QUEUED   == vbq::flags::queued);
static_assert(V4L2_BUF_FLAG_DONE     == vbq::flags::done);
static_assert(V4L2_BUF_FLAG_KEYFRAME == vbq::flags::keyframe);
static_assert(V4L2_BUF_FLAG_PFRAME   == vbq::flags::pframe);
static_assert(V4L2_BUF_FLAG_BFRAME   == vbq::flags::bframe);
static_assert(V4L2_BUF_FLAG_ERROR    == vbq::flags::error);
static_assert(V4L2_BUF_FLAG_LAST     == vbq::flags::last);

static_assert(V4L2_BUF_CAP_SUPPORTS_MMAP          == vbq::caps::mmap);
static_assert(V4L2_BUF_CAP_SUPPORTS_USERPTR       == vbq::caps::userptr);
static_assert(V4L2_BUF_CAP_SUPPORTS_DMABUF        == vbq::caps::dmabuf);
static_assert(V4L2_BUF_CAP_SUPPORTS_REQUESTS      == vbq::caps::requests);
static_assert(V4L2_BUF_CAP_SUPPORTS_ORPHANED_BUFS == vbq::caps::orphaned);

namespace local {

static constexpr vbq::u32 known_caps {
    V4L2_BUF_CAP_SUPPORTS_MMAP | V4L2_BUF_CAP_SUPPORTS_USERPTR | V4L2_BUF_CAP_SUPPORTS_DMABUF |
    V4L2_BUF_CAP_SUPPORTS_REQUESTS | V4L2_BUF_CAP_SUPPORTS_ORPHANED_BUFS
};

// buffer flags vbq::flags names, timestamp and timecode bits are dropped
static constexpr vbq::u32 known_flags {
    V4L2_BUF_FLAG_MAPPED | V4L2_BUF_FLAG_QUEUED | V4L2_BUF_FLAG_DONE | V4L2_BUF_FLAG_KEYFRAME |
    V4L2_BUF_FLAG_PFRAME | V4L2_BUF_FLAG_BFRAME | V4L2_BUF_FLAG_ERROR | V4L2_BUF_FLAG_LAST
};

static const char*
name (const unsigned long request) noexcept {
    switch (request) {
        case VIDIOC_REQBUFS:   return "VIDIOC_REQBUFS";
        case VIDIOC_QUERYBUF:  return "VIDIOC_QUERYBUF";
        case VIDIOC_QBUF:      return "VIDIOC_QBUF";
        case VIDIOC_DQBUF:     return "VIDIOC_DQBUF";
        case VIDIOC_STREAMON:  return "VIDIOC_STREAMON";
        case VIDIOC_STREAMOFF: return "VIDIOC_STREAMOFF";
        default:               return "VIDIOC_?";
    }
}

// issue the request, log failures, map errno
static vbq::status
call (vbq::io::node& node, const unsigned long request, void *arg) noexcept {

    const vbq::i32 err = node.ioctl(request, arg);

    if (0 == err)
        return {};

    if (EAGAIN == err and VIDIOC_DQBUF == request)
        return vbq::fail(vbq::errc::would_block, err);

    std::fprintf(stderr, "[ioctl] %s failed %d:%s\n", name(request), err, std::strerror(err));

    return vbq::fail(vbq::errc::rejected, err);
}

}

vbq::u32
vbq::io::buftype (const bool out, const bool mplane) noexcept {

    if (out)
        return mplane ? V4L2_BUF_TYPE_VIDEO_OUTPUT_MPLANE : V4L2_BUF_TYPE_VIDEO_OUTPUT;

    return mplane ? V4L2_BUF_TYPE_VIDEO_CAPTURE_MPLANE : V4L2_BUF_TYPE_VIDEO_CAPTURE;
}

bool
vbq::io::is_mplane (const u32 type) noexcept {
    return V4L2_BUF_TYPE_VIDEO_CAPTURE_MPLANE == type or V4L2_BUF_TYPE_VIDEO_OUTPUT_MPLANE == type;
}

///////////////////////////////////////
//// REQUEST / RELEASE BUFFERS     ////
///////////////////////////////////////
vbq::result<vbq::io::reqinfo>
vbq::io::reqbufs (node& node, const u32 type, const memory mem, const u32 count) noexcept {

    struct v4l2_requestbuffers req {};

    std::memset(&req, 0, sizeof(req));

    req.count  = count;
    req.type   = type;
    req.memory = u32(mem);

    const status stat = local::call(node, VIDIOC_REQBUFS, &req);

    if (!stat)
        return stat;

    return reqinfo { req.count, req.capabilities & local::known_caps };
}

///////////////////////////////////////
//// QUEUE BUFFER                  ////
///////////////////////////////////////
vbq::status
vbq::io::qbuf (node& node, const u32 type, const qdesc& desc) noexcept {

    struct v4l2_buffer buf {};
    struct v4l2_plane  planes[VIDEO_MAX_PLANES] {};

    std::memset(&buf,   0, sizeof(buf));
    std::memset(planes, 0, sizeof(planes));

    buf.index  = desc.index;
    buf.type   = type;
    buf.memory = u32(desc.mem);
    buf.flags  = desc.flags;
    buf.field  = desc.field;

    if (is_mplane(type)) {

        if (desc.planes.size() > VIDEO_MAX_PLANES)
            return fail(errc::too_many_planes);

        for (std::size_t i = 0; i < desc.planes.size(); ++i) {
            planes[i].bytesused   = desc.planes[i].bytesused;
            planes[i].data_offset = desc.planes[i].offset;
            planes[i].length      = desc.planes[i].length;

            if (memory::userptr == desc.mem)
                planes[i].m.userptr = desc.planes[i].userptr;
        }

        buf.m.planes = planes;
        buf.length   = u32(desc.planes.size());

    } else {

        if (desc.planes.empty())
            return fail(errc::too_few_planes);

        if (desc.planes.size() > 1)
            return fail(errc::too_many_planes);

        buf.bytesused = desc.planes[0].bytesused;
        buf.length    = desc.planes[0].length;

        if (memory::userptr == desc.mem)
            buf.m.userptr = desc.planes[0].userptr;
    }

    return local::call(node, VIDIOC_QBUF, &buf);
}

///////////////////////////////////////
//// DEQUEUE BUFFER                ////
///////////////////////////////////////
vbq::result<vbq::dqbuffer>
vbq::io::dqbuf (node& node, const u32 type, const memory mem) noexcept {

    struct v4l2_buffer buf {};
    struct v4l2_plane  planes[VIDEO_MAX_PLANES] {};

    std::memset(&buf,   0, sizeof(buf));
    std::memset(planes, 0, sizeof(planes));

    buf.type   = type;
    buf.memory = u32(mem);

    const bool mplane = is_mplane(type);

    if (mplane) {
        buf.m.planes = planes;
        buf.length   = VIDEO_MAX_PLANES;
    }

    const status stat = local::call(node, VIDIOC_DQBUF, &buf);

    if (!stat)
        return stat;

    dqbuffer out {};

    out.index    = buf.index;
    out.flags    = buf.flags & local::known_flags;
    out.field    = buf.field;
    out.sequence = buf.sequence;
    out.sec      = i64(buf.timestamp.tv_sec);
    out.usec     = i64(buf.timestamp.tv_usec);

    if (mplane) {
        const u32 count = std::min<u32>(buf.length, VIDEO_MAX_PLANES);
        out.planes.reserve(count);
        for (u32 i = 0; i < count; ++i)
            out.planes.push_back({ planes[i].length, planes[i].bytesused, planes[i].data_offset });
    } else {
        out.planes.push_back({ buf.length, buf.bytesused, 0 });
    }

    return out;
}

///////////////////////////////////////
//// STREAM ON / OFF               ////
///////////////////////////////////////
vbq::status
vbq::io::streamon (node& node, const u32 type) noexcept {
    int arg = int(type);
    return local::call(node, VIDIOC_STREAMON, &arg);
}

vbq::status
vbq::io::streamoff (node& node, const u32 type) noexcept {
    int arg = int(type);
    return local::call(node, VIDIOC_STREAMOFF, &arg);
}

///////////////////////////////////////
//// QUERY BUFFER FOR MAPPING      ////
///////////////////////////////////////
vbq::result<vbq::io::qinfo>
vbq::io::querybuf (node& node, const u32 type, const memory mem, const u32 index) noexcept {

    struct v4l2_buffer buf {};
    struct v4l2_plane  planes[VIDEO_MAX_PLANES] {};

    std::memset(&buf,   0, sizeof(buf));
    std::memset(planes, 0, sizeof(planes));

    buf.index  = index;
    buf.type   = type;
    buf.memory = u32(mem);

    const bool mplane = is_mplane(type);

    if (mplane) {
        buf.m.planes = planes;
        buf.length   = VIDEO_MAX_PLANES;
    }

    const status stat = local::call(node, VIDIOC_QUERYBUF, &buf);

    if (!stat)
        return stat;

    qinfo info {};

    info.index = buf.index;
    info.flags = buf.flags & local::known_flags;

    if (mplane) {
        const u32 count = std::min<u32>(buf.length, VIDEO_MAX_PLANES);
        for (u32 i = 0; i < count; ++i)
            info.planes.push_back({ planes[i].length, planes[i].m.mem_offset });
    } else {
        info.planes.push_back({ buf.length, buf.m.offset });
    }

    return info;
}

vbq::result<bool>
vbq::io::probe (node& node, const bool out) noexcept {

    if (reqbufs(node, buftype(out, false), memory::mmap, 0))
        return false;

    if (reqbufs(node, buftype(out, true), memory::mmap, 0))
        return true;

    std::fprintf(stderr, "[ioctl] neither single nor multi-planar %s queue usable\n", out ? "output" : "capture");

    return fail(errc::rejected, EINVAL);
}
