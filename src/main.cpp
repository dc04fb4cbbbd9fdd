#include "cfc/ansi.hpp"
#include "cfc/app.hpp"
#include "cfc/log.hpp"

int main()
{
    cfc::ansi::enable_virtual_terminal_on_windows();
    cfc::log::init_from_env();
    app::Application app;
    return app.run();
}
