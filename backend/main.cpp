#include <csignal>
#include <cstdio>

#include "view.hpp"

static void interrupt (int) noexcept {
    vbq::vw::quit();
}

int main (int argc, char* argv[]) noexcept
{
    vbq::vw::conf conf {};

    if (!vbq::vw::read(argc, argv, conf))
        return 2;

    std::signal(SIGINT,  interrupt);
    std::signal(SIGTERM, interrupt);

    if (!vbq::vw::init(conf)) {
        vbq::vw::stop();
        return 1;
    }

    while ( vbq::vw::exec() ) {
    }

    vbq::vw::stop();

    return 0;
}
