#ifndef __VBQ_VIDEO_NODE_HPP__
#define __VBQ_VIDEO_NODE_HPP__ 1

#include <memory>
#include <string>
#include "defs.hpp"

namespace vbq::io
{
    // anything that answers V4L2 requests: the real device node or a simulation.
    // ioctl returns 0 on success or the errno value of the failure
    class node {
    public:
        virtual ~node (void) = default;

        virtual i32  ioctl       (unsigned long, void*) noexcept = 0;
        virtual bool nonblocking (void) const noexcept = 0;
        virtual i32  handle      (void) const noexcept = 0; // fd for poll/mmap, -1 when none
    };

    // /dev/videoN opened read-write
    class device final : public node {
    public:
        ~device (void) override;

        device (const device&)            = delete;
        device& operator= (const device&) = delete;

        static result<std::unique_ptr<device>> open (const std::string&, const bool nonblock) noexcept ;

        i32  ioctl       (unsigned long, void*) noexcept override;
        bool nonblocking (void) const noexcept override { return nonblock; }
        i32  handle      (void) const noexcept override { return fd; }

        const std::string& path (void) const noexcept { return name; }

    private:
        device (const i32, const bool, std::string) noexcept ;

        i32         fd       {-1};
        bool        nonblock {false};
        std::string name     {};
    };
}

#endif
