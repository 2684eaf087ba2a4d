#include <cstring>
#include "defs.hpp"

const char*
vbq::what (const errc code) noexcept {

    switch (code) {
        case errc::ok:                return "ok";
        case errc::rejected:          return "device rejected the request";
        case errc::too_few_planes:    return "not enough planes for the format";
        case errc::too_many_planes:   return "too many planes for the format";
        case errc::no_free_buffer:    return "no free buffer";
        case errc::still_in_use:      return "buffers still in use";
        case errc::none_queued:       return "no buffer queued";
        case errc::would_block:       return "no buffer ready";
        case errc::already_allocated: return "buffers already allocated";
        case errc::not_allocated:     return "no buffers allocated";
        case errc::bad_index:         return "buffer index out of range";
        case errc::bad_plane:         return "plane memory unusable: empty, or 4 GiB and over";
    }

    return "unknown error";
}

const char*
vbq::what (const status stat) noexcept {

    if (errc::rejected == stat.code and 0 != stat.os)
        return std::strerror(stat.os);

    return what(stat.code);
}
