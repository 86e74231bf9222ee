#pragma once

#include "core/common.hpp"
#include <boost/asio.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace house
{
    // Line-framed JSON connection shared by the menu loop and the keep-alive thread.
    class Connection
    {
      public:
        Connection(boost::asio::io_context& io_context, std::string_view const address, uint32_t const port);

        auto write(core::MessageType const message_type, nlohmann::json const& payload) -> void;

        auto read() -> nlohmann::json;

        auto close() -> void;

        auto is_open() const -> bool;

      private:
        boost::asio::ip::tcp::socket m_socket;
        boost::asio::streambuf m_read_buffer;
        std::mutex m_write_mutex;
    };

    class Packet
    {
      public:
        Packet(core::MessageType const message_type);

        virtual ~Packet() = default;

        // Sends the request and reads until its answer or an error arrives. Server pushes that are not
        // the answer (heartbeats, settlement notices) are printed and skipped. A lost connection is
        // closed and reported as an error.
        auto process(Connection& connection) -> bool;

        auto error() const -> std::optional<std::string> const&;

      protected:
        // Returns false when the message is not the answer to this packet.
        virtual auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool = 0;

        virtual auto send(nlohmann::json& payload) -> void = 0;

      private:
        core::MessageType m_message_type;
        std::optional<std::string> m_error;
    };
} // namespace house
