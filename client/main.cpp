#include "client.hpp"
#include "precompiled.hpp"
#include <argh.h>

auto main(int32_t argc, char** argv) -> int32_t
{
    argh::parser command_line(argc, argv, argh::parser::PREFER_PARAM_FOR_UNREG_OPTION);

    uint32_t port;
    if (!(command_line({"-p", "--port"}) >> port))
    {
        port = 5555;
    }

    std::string address;
    if (!(command_line({"-c", "--connect"}) >> address))
    {
        address = "127.0.0.1";
    }

    std::string player_id;
    if (!(command_line({"-u", "--player"}) >> player_id))
    {
        std::cout << "Type your player id: ";
        std::cin >> player_id;
    }

    try
    {
        house::Client client(address, port, player_id);
        client.run();
        return EXIT_SUCCESS;
    }
    catch (std::exception const& e)
    {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
