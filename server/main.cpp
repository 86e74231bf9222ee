#include "precompiled.hpp"
#include "server.hpp"
#include "settings.hpp"
#include <argh.h>

auto main(int32_t argc, char** argv) -> int32_t
{
    argh::parser command_line(argc, argv, argh::parser::PREFER_PARAM_FOR_UNREG_OPTION);

    try
    {
        auto const settings = house::parse_settings(command_line);

        if (settings.trace)
        {
            spdlog::set_level(spdlog::level::trace);
        }
        else
        {
#ifndef NDEBUG
            spdlog::set_level(spdlog::level::debug);
#else
            spdlog::set_level(spdlog::level::info);
#endif
        }

        house::Server server(settings);
        server.run();
        return EXIT_SUCCESS;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
