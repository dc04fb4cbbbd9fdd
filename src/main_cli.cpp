#include <iostream>

#include "cfc/ansi.hpp"
#include "cfc/cli.hpp"
#include "cfc/log.hpp"

int main(int argc, char **argv)
{
    cfc::ansi::enable_virtual_terminal_on_windows();
    cfc::log::init_from_env();

    app::cli::Options opt;
    if (!app::cli::parse_args(argc, argv, opt))
    {
        std::cerr << app::cli::kUsage;
        return app::cli::EXIT_USAGE;
    }
    return app::cli::run(opt);
}
