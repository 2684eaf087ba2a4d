#include <getopt.h>
#include <linux/videodev2.h>
#include <algorithm>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "view.hpp"
#include "node.hpp"
#include "ioct.hpp"
#include "mmap.hpp"
#include "uptr.hpp"
#include "queue.hpp"
#include "wait.hpp"

namespace core {
    using plane_data = std::vector<vbq::u08>;
    using frame      = std::vector<plane_data>; // one raw buffer, per plane
    using raw_mem    = vbq::mm::uptr<plane_data>;
    using raw_queue  = vbq::output_queue<raw_mem>;
    using raw_buffer = vbq::qbuffer<vbq::output, raw_mem>;
    using enc_queue  = vbq::capture_queue<vbq::mm::mmap>;

    static vbq::vw::conf                              conf   {};
    static std::unique_ptr<vbq::io::device>           device {};
    static std::unique_ptr<enc_queue>                 cap    {};    // camera frames or encoded stream
    static std::unique_ptr<raw_queue>                 raw    {};    // encode mode only
    static std::vector<std::vector<vbq::mm::mapping>> maps   {};    // capture buffer -> planes
    static std::vector<frame>                         pool   {};    // raw frames not queued
    static vbq::format                                rawfmt {};
    static vbq::u32                                   fourcc {0};   // capture format
    static vbq::u32                                   count  {0};   // frames taken
    static vbq::u32                                   sent   {0};   // raw frames queued
    static vbq::u64                                   total  {0};   // encoded bytes, wraps
    static volatile std::sig_atomic_t                 halt   {0};
}

namespace local {

using namespace vbq;

static bool
usage (const char* name) noexcept {
    std::fprintf(stderr, "usage: %s [-d device] [-m capture|encode] [-n buffers] [-f frames] [-t timeout ms] [-b]\n", name);
    return false;
}

static std::string
fourcc (const u32 code) noexcept {
    return { char(code & 0xFF), char((code >> 8) & 0xFF), char((code >> 16) & 0xFF), char((code >> 24) & 0xFF) };
}

static format
convert (const v4l2_format& f, const bool mplane) noexcept {

    format fmt {};

    if (mplane) {
        fmt.width  = f.fmt.pix_mp.width;
        fmt.height = f.fmt.pix_mp.height;
        fmt.fourcc = f.fmt.pix_mp.pixelformat;

        const u32 planes = std::min<u32>(f.fmt.pix_mp.num_planes, VIDEO_MAX_PLANES);

        for (u32 i = 0; i < planes; ++i)
            fmt.planes.push_back({ f.fmt.pix_mp.plane_fmt[i].sizeimage, f.fmt.pix_mp.plane_fmt[i].bytesperline });
    } else {
        fmt.width  = f.fmt.pix.width;
        fmt.height = f.fmt.pix.height;
        fmt.fourcc = f.fmt.pix.pixelformat;
        fmt.planes.push_back({ f.fmt.pix.sizeimage, f.fmt.pix.bytesperline });
    }

    return fmt;
}

///////////////////////////////////////
//// FORMAT NEGOTIATION            ////
///////////////////////////////////////
// the driver may adjust every field, the answer is what counts
static result<format>
negotiate (io::node& node, const u32 type, const u32 width, const u32 height, const u32 code) noexcept {

    struct v4l2_format fmt {};

    std::memset(&fmt, 0, sizeof(fmt));

    fmt.type = type;

    i32 err = node.ioctl(VIDIOC_G_FMT, &fmt);

    if (0 != err) {
        std::fprintf(stderr, "[view] VIDIOC_G_FMT failed %d:%s\n", err, std::strerror(err));
        return fail(errc::rejected, err);
    }

    const bool mplane = io::is_mplane(type);

    if (mplane) {
        fmt.fmt.pix_mp.width       = width;
        fmt.fmt.pix_mp.height      = height;
        fmt.fmt.pix_mp.pixelformat = code;
    } else {
        fmt.fmt.pix.width       = width;
        fmt.fmt.pix.height      = height;
        fmt.fmt.pix.pixelformat = code;
    }

    err = node.ioctl(VIDIOC_S_FMT, &fmt);

    if (0 != err) {
        std::fprintf(stderr, "[view] VIDIOC_S_FMT %ux%u %s failed %d:%s\n",
                     width, height, fourcc(code).c_str(), err, std::strerror(err));
        return fail(errc::rejected, err);
    }

    const format out = convert(fmt, mplane);

    std::fprintf(stderr, "[view] %s format %ux%u %s, %zu planes\n",
                 V4L2_TYPE_IS_OUTPUT(type) ? "output" : "capture",
                 out.width, out.height, fourcc(out.fourcc).c_str(), out.planes.size());

    return out;
}

// mean luma of YUYV data: [Y][U][Y][V]
static f32
luma (const u08* src, const std::size_t size) noexcept {

    if (size < 2)
        return 0.0f;

    u64 sum {0};

    for (std::size_t i = 0; i < size; i += 2)
        sum += src[i];

    return f32(sum) / f32(size / 2);
}

// moving gradient, rgb24
static void
pattern (core::plane_data& dst, const u32 stride, const u32 height, const u32 seq) noexcept {

    if (0 == stride)
        return;

    const u32 rows = std::min<u32>(height, u32(dst.size() / stride));

    for (u32 y = 0; y < rows; ++y) {
        u08* row = dst.data() + std::size_t(y) * stride;
        for (u32 x = 0; x + 2 < stride; x += 3) {
            row[x + 0] = u08(x / 3 + seq);
            row[x + 1] = u08(y + seq);
            row[x + 2] = u08(x / 3 + y);
        }
    }
}

static bool
requeue (const u32 index) noexcept {

    auto buffer = core::cap->get_buffer(index);

    if (!buffer) {
        std::fprintf(stderr, "[view] buffer %u unavailable: %s\n", index, what(buffer.stat));
        return false;
    }

    const auto stat = std::move(*buffer).auto_fill();

    if (!stat) {
        std::fprintf(stderr, "[view] buffer %u not queued: %s\n", index, what(stat.stat));
        return false;
    }

    return true;
}

static wt::wake
ready (const bool out) noexcept {

    if (core::conf.blocking)
        return wt::wake::ready;

    const wt::wake w = wt::wait(out, core::conf.timeout);

    if (wt::wake::timeout == w)
        std::fprintf(stderr, "[view] no %s buffer within %u ms\n", out ? "output" : "capture", core::conf.timeout);

    return w;
}

static bool
more (void) noexcept {
    return 0 == core::conf.frames or core::count < core::conf.frames;
}

///////////////////////////////////////
//// CAMERA CAPTURE                ////
///////////////////////////////////////
static bool
init_capture (void) noexcept {

    io::node& dev = *core::device;

    const result<bool> mplane = io::probe(dev, false);

    if (!mplane)
        return false;

    const u32 type = io::buftype(false, *mplane);

    const result<format> fmt = negotiate(dev, type, 640, 480, V4L2_PIX_FMT_YUYV);

    if (!fmt)
        return false;

    if (V4L2_PIX_FMT_YUYV != fmt->fourcc)
        std::fprintf(stderr, "[view] camera gives %s, no luma readout\n", fourcc(fmt->fourcc).c_str());

    core::fourcc = fmt->fourcc;
    core::cap    = std::make_unique<core::enc_queue>(dev, *mplane);

    const result<u32> count = core::cap->allocate(core::conf.buffers, *fmt);

    if (!count) {
        std::fprintf(stderr, "[view] capture buffers: %s\n", what(count.stat));
        return false;
    }

    if (*count < 2)
        std::fprintf(stderr, "[view] only %u capture buffers\n", *count);

    if (0 == *count)
        return false;

    for (u32 i = 0; i < *count; ++i) {

        const result<io::qinfo> info = io::querybuf(dev, type, memory::mmap, i);

        if (!info)
            return false;

        std::vector<mm::mapping> planes {};

        for (const io::qinfo::plane& p : info->planes) {

            result<mm::mapping> map = mm::mapping::map(dev, p.length, p.offset);

            if (!map)
                return false;

            planes.push_back(std::move(*map));
        }

        core::maps.push_back(std::move(planes));
    }

    for (u32 i = 0; i < *count; ++i)
        if (!requeue(i))
            return false;

    const status on = core::cap->stream_on();

    if (!on) {
        std::fprintf(stderr, "[view] capture stream: %s\n", what(on));
        return false;
    }

    return true;
}

static bool
exec_capture (void) noexcept {

    const wt::wake w = ready(false);

    if (wt::wake::error == w)
        return false;

    if (wt::wake::timeout == w)
        return true;

    auto frame = core::cap->dequeue();

    if (!frame) {
        if (errc::would_block == frame.stat.code)
            return true;

        std::fprintf(stderr, "[view] dequeue: %s\n", what(frame.stat));
        return false;
    }

    const dqbuffer& d = frame->data;

    if (d.flags & flags::error)
        std::fprintf(stderr, "[view] frame %u flagged corrupt\n", d.sequence);

    if (!d.planes.empty() and V4L2_PIX_FMT_YUYV == core::fourcc) {

        const mm::mapping& map  = core::maps[frame->index][0];
        const std::size_t  used = std::min<std::size_t>(d.planes[0].bytesused, map.size());

        std::fprintf(stderr, "[view] frame %u index %u: %u bytes, luma %.1f\n",
                     d.sequence, frame->index, d.planes[0].bytesused, luma(map.data(), used));
    }

    if (!requeue(frame->index))
        return false;

    ++core::count;

    return more();
}

///////////////////////////////////////
//// MEMORY TO MEMORY ENCODE       ////
///////////////////////////////////////
static bool
init_encode (void) noexcept {

    io::node& dev = *core::device;

    struct v4l2_capability cap {};

    std::memset(&cap, 0, sizeof(cap));

    const i32 err = dev.ioctl(VIDIOC_QUERYCAP, &cap);

    if (0 != err) {
        std::fprintf(stderr, "[view] VIDIOC_QUERYCAP failed %d:%s\n", err, std::strerror(err));
        return false;
    }

    const char* driver = reinterpret_cast<const char*>(cap.driver);

    std::fprintf(stderr, "[view] driver %s card %s\n", driver, reinterpret_cast<const char*>(cap.card));

    if (0 != std::strcmp(driver, "vicodec"))
        std::fprintf(stderr, "[view] encode mode expects vicodec\n");

    const result<bool> mplane = io::probe(dev, true);

    if (!mplane)
        return false;

    const result<format> in = negotiate(dev, io::buftype(true, *mplane), 640, 480, V4L2_PIX_FMT_RGB24);

    if (!in)
        return false;

    const result<format> out = negotiate(dev, io::buftype(false, *mplane), in->width, in->height, V4L2_PIX_FMT_FWHT);

    if (!out)
        return false;

    core::rawfmt = *in;
    core::fourcc = out->fourcc;
    core::raw    = std::make_unique<core::raw_queue>(dev, *mplane);
    core::cap    = std::make_unique<core::enc_queue>(dev, *mplane);

    const result<u32> nraw = core::raw->allocate(core::conf.buffers, *in);
    const result<u32> nenc = core::cap->allocate(core::conf.buffers, *out);

    if (!nraw or !nenc) {
        std::fprintf(stderr, "[view] encoder buffers: %s / %s\n", what(nraw.stat), what(nenc.stat));
        return false;
    }

    if (0 == *nraw or 0 == *nenc)
        return false;

    std::fprintf(stderr, "[view] %u output and %u capture buffers\n", *nraw, *nenc);

    for (u32 i = 0; i < *nraw; ++i) {
        core::frame f {};
        for (const plane_fmt& p : core::rawfmt.planes)
            f.emplace_back(p.sizeimage);
        core::pool.push_back(std::move(f));
    }

    for (u32 i = 0; i < *nenc; ++i)
        if (!requeue(i))
            return false;

    const status on_raw = core::raw->stream_on();
    const status on_enc = on_raw ? core::cap->stream_on() : on_raw;

    if (!on_enc) {
        std::fprintf(stderr, "[view] encoder stream: %s\n", what(on_enc));
        return false;
    }

    return true;
}

// fill a pooled frame and hand it to the encoder
static bool
feed (void) noexcept {

    auto buffer = core::raw->get_buffer();

    if (!buffer)
        return errc::no_free_buffer == buffer.stat.code;

    core::frame f = std::move(core::pool.back());
    core::pool.pop_back();

    std::optional<core::raw_buffer> builder {};
    builder.emplace(std::move(*buffer));

    for (std::size_t i = 0; i < f.size(); ++i) {

        pattern(f[i], core::rawfmt.planes[i].bytesperline, core::rawfmt.height, core::sent);

        const u32 used = u32(f[i].size());

        auto next = std::move(*builder).add_plane(plane<output, core::raw_mem>::out(std::move(f[i]), used));
        builder.emplace(std::move(next));
    }

    auto stat = std::move(*builder).submit();

    if (!stat) {
        std::fprintf(stderr, "[view] raw frame refused: %s\n", what(stat.stat));
        core::pool.push_back(std::move(stat.planes));
        return false;
    }

    ++core::sent;

    return true;
}

// raw frames the encoder is done with go back to the pool
static bool
reclaim (void) noexcept {

    while (0 != core::raw->num_queued()) {

        auto done = core::raw->dequeue<discard>();

        if (!done) {
            if (errc::would_block == done.stat.code)
                return true;

            std::fprintf(stderr, "[view] raw dequeue: %s\n", what(done.stat));
            return false;
        }

        core::pool.push_back(std::move(done->planes));

        if (core::conf.blocking)
            return true;
    }

    return true;
}

static bool
exec_encode (void) noexcept {

    if (!core::pool.empty() and (0 == core::conf.frames or core::sent < core::conf.frames))
        if (!feed())
            return false;

    const wt::wake w = ready(false);

    if (wt::wake::error == w)
        return false;

    if (wt::wake::timeout == w)
        return reclaim();

    auto enc = core::cap->dequeue();

    if (!enc) {
        if (errc::would_block != enc.stat.code) {
            std::fprintf(stderr, "[view] encoded dequeue: %s\n", what(enc.stat));
            return false;
        }
        return reclaim();
    }

    const u32 used = enc->data.planes.empty() ? 0 : enc->data.planes[0].bytesused;

    core::total += used;

    std::fprintf(stderr, "[view] encoded %5u index %2u: %6u bytes, total %8llu\n",
                 enc->data.sequence, enc->index, used, static_cast<unsigned long long>(core::total));

    ++core::count;

    if (!requeue(enc->index))
        return false;

    if (!reclaim())
        return false;

    return more();
}

}

bool
vbq::vw::read (int argc, char* argv[], conf& c) noexcept {

    int opt {0};

    while (-1 != (opt = ::getopt(argc, argv, "d:m:n:f:t:b"))) {
        switch (opt) {
            case 'd': c.device  = optarg; break;
            case 'n': c.buffers = u32(std::strtoul(optarg, nullptr, 10)); break;
            case 'f': c.frames  = u32(std::strtoul(optarg, nullptr, 10)); break;
            case 't': c.timeout = u32(std::strtoul(optarg, nullptr, 10)); break;
            case 'b': c.blocking = true; break;
            case 'm':
                if (0 == std::strcmp(optarg, "capture")) {
                    c.run = mode::capture;
                } else if (0 == std::strcmp(optarg, "encode")) {
                    c.run = mode::encode;
                } else {
                    return local::usage(argv[0]);
                }
                break;
            default:
                return local::usage(argv[0]);
        }
    }

    if (0 == c.buffers) {
        std::fprintf(stderr, "[view] at least one buffer\n");
        return local::usage(argv[0]);
    }

    return true;
}

bool
vbq::vw::init (const conf& c) noexcept {

    core::conf = c;

    result<std::unique_ptr<io::device>> dev = io::device::open(c.device, !c.blocking);

    if (!dev)
        return false;

    core::device = std::move(*dev);

    const bool ok = mode::capture == c.run ? local::init_capture() : local::init_encode();

    if (!ok)
        return false;

    if (!c.blocking and !wt::init(core::device->handle()))
        return false;

    std::fprintf(stderr, "[view] %s on %s, %s\n", mode::capture == c.run ? "capture" : "encode",
                 c.device.c_str(), c.blocking ? "blocking" : "non-blocking");

    return true;
}

bool
vbq::vw::exec (void) noexcept {

    if (core::halt)
        return false;

    return mode::capture == core::conf.run ? local::exec_capture() : local::exec_encode();
}

void
vbq::vw::stop (void) noexcept {

    wt::stop();

    if (core::cap and core::cap->is_streaming()) {
        const auto back = core::cap->stream_off();
        if (!back)
            std::fprintf(stderr, "[view] capture stream off: %s\n", what(back.stat));
    }

    if (core::raw and core::raw->is_streaming()) {
        auto back = core::raw->stream_off();
        if (back) {
            for (released<core::raw_mem>& r : *back)
                core::pool.push_back(std::move(r.planes));
        } else {
            std::fprintf(stderr, "[view] output stream off: %s\n", what(back.stat));
        }
    }

    // unmapped before the driver frees the buffers
    core::maps.clear();

    core::cap.reset();
    core::raw.reset();
    core::pool.clear();
    core::device.reset();

    if (mode::encode == core::conf.run)
        std::fprintf(stderr, "[view] %u frames encoded, %llu bytes\n", core::count, static_cast<unsigned long long>(core::total));
    else
        std::fprintf(stderr, "[view] %u frames captured\n", core::count);
}

void
vbq::vw::quit (void) noexcept {
    core::halt = 1;
}
