#ifndef __VBQ_DEMO_VIEW_HPP__
#define __VBQ_DEMO_VIEW_HPP__ 1

#include <string>
#include "defs.hpp"

namespace vbq::vw {

    enum struct mode : u08 {
        capture = 0, // camera frames through a mmap ring
        encode  = 1  // vicodec: user memory in, compressed mmap out
    };

    struct conf final {
        std::string device   {"/dev/video0"};
        mode        run      {mode::capture};
        u32         buffers  {2};
        u32         frames   {0};    // 0: until interrupted
        u32         timeout  {1000}; // ms
        bool        blocking {false};
    };

    // command line, false on bad arguments
    bool read (int argc, char* argv[], conf&) noexcept ;

    bool init (const conf&) noexcept ;
    bool exec (void)        noexcept ; // false once done or failed
    void stop (void)        noexcept ;

    void quit (void) noexcept ;       // async-signal-safe
}

#endif
