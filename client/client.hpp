#pragma once

#include "packet.hpp"
#include <atomic>
#include <thread>

namespace house
{
    class Client
    {
      public:
        Client(std::string_view const address, uint32_t const port, std::string_view const player_id);

        ~Client();

        auto run() -> void;

      private:
        boost::asio::io_context m_io_context;
        Connection m_connection;
        std::string m_player_id;

        std::string m_last_round_id;

        std::atomic<bool> m_running;
        std::thread m_keep_alive;

        // Sends a ping every few seconds so the connection survives idle time at the menu.
        auto keep_alive() -> void;

        auto play() -> void;
    };
} // namespace house
