#include <chrono>
#include <cstdio>
#include <asio.hpp>
#include "wait.hpp"

namespace core {

    using asio::posix::stream_descriptor;

    static asio::io_context    context {};
    static stream_descriptor*  stream  {nullptr};
    static asio::steady_timer* timer   {nullptr};
}

namespace local {

static void
on_ready (const asio::error_code& ec, vbq::wt::wake& outcome) {

    if (asio::error::operation_aborted == ec)
        return;

    if (ec) {
        std::fprintf(stderr, "[wait] poll error: %s\n", ec.message().c_str());
        outcome = vbq::wt::wake::error;
    } else {
        outcome = vbq::wt::wake::ready;
    }

    core::timer->cancel();
}

static void
on_timeout (const asio::error_code& ec) {

    if (ec)
        return;

    asio::error_code ignored {};
    core::stream->cancel(ignored);
}

}

bool
vbq::wt::init (const i32 fd) noexcept {

    if (nullptr != core::stream)
        return true;

    if (fd < 0) {
        std::fprintf(stderr, "[wait] no descriptor to watch\n");
        return false;
    }

    asio::error_code ec {};

    core::stream = new core::stream_descriptor(core::context);
    core::stream->assign(fd, ec);

    if (ec) {
        std::fprintf(stderr, "[wait] cannot watch fd %d: %s\n", fd, ec.message().c_str());
        delete core::stream;
        core::stream = nullptr;
        return false;
    }

    core::timer = new asio::steady_timer(core::context);

    std::fprintf(stderr, "[wait] watching fd %d\n", fd);

    return true;
}

void
vbq::wt::stop (void) noexcept {

    if (nullptr == core::stream)
        return;

    // hand the descriptor back untouched, the device closes it
    static_cast<void>(core::stream->release());

    delete core::stream;
    delete core::timer;

    core::stream = nullptr;
    core::timer  = nullptr;

    core::context.stop();

    std::fprintf(stderr, "[wait] stopped\n");
}

vbq::wt::wake
vbq::wt::wait (const bool out, const u32 timeout_ms) noexcept {

    if (nullptr == core::stream)
        return wake::error;

    wake outcome {wake::timeout};

    const auto direction = out ? core::stream_descriptor::wait_write : core::stream_descriptor::wait_read;

    core::stream->async_wait(direction, [&outcome](const asio::error_code& ec) {
        local::on_ready(ec, outcome);
    });

    core::timer->expires_after(std::chrono::milliseconds(timeout_ms));
    core::timer->async_wait([](const asio::error_code& ec) {
        local::on_timeout(ec);
    });

    core::context.restart();
    core::context.run();

    return outcome;
}

const char*
vbq::wt::what (const wake w) noexcept {
    switch (w) {
        case wake::ready:   return "ready";
        case wake::timeout: return "timeout";
        case wake::error:   return "error";
    }
    return "?";
}
