#ifndef __VBQ_DEVICE_WAIT_HPP__
#define __VBQ_DEVICE_WAIT_HPP__ 1

#include "defs.hpp"

namespace vbq::wt {

    enum struct wake : u08 {
        ready   = 0,
        timeout = 1,
        error   = 2
    };

    // watch an already open descriptor, which stays owned by the caller
    bool init (const i32 fd) noexcept ;
    void stop (void)         noexcept ;

    // out: room for another output buffer, otherwise a finished capture buffer
    wake wait (const bool out, const u32 timeout_ms) noexcept ;

    const char* what (const wake) noexcept ;
}

#endif
