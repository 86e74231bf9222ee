#include "packet.hpp"
#include "precompiled.hpp"

namespace house
{
    Connection::Connection(boost::asio::io_context& io_context, std::string_view const address, uint32_t const port)
        : m_socket(io_context)
    {
        m_socket.connect(
            boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(std::string(address)), port));
    }

    auto Connection::write(core::MessageType const message_type, nlohmann::json const& payload) -> void
    {
        nlohmann::json packet;
        packet["type"] = message_type;
        packet["payload"] = payload;

        std::string const message = packet.dump() + '\n';

        std::lock_guard lock(m_write_mutex);
        boost::asio::write(m_socket, boost::asio::buffer(message));
    }

    auto Connection::read() -> nlohmann::json
    {
        boost::asio::read_until(m_socket, m_read_buffer, '\n');
        std::istream is(&m_read_buffer);

        std::string message;
        std::getline(is, message);
        return nlohmann::json::parse(message);
    }

    auto Connection::close() -> void
    {
        std::lock_guard lock(m_write_mutex);

        boost::system::error_code error;
        m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, error);
        m_socket.close(error);
    }

    auto Connection::is_open() const -> bool
    {
        return m_socket.is_open();
    }

    Packet::Packet(core::MessageType const message_type) : m_message_type(message_type)
    {
    }

    auto Packet::error() const -> std::optional<std::string> const&
    {
        return m_error;
    }

    auto Packet::process(Connection& connection) -> bool
    {
        try
        {
            nlohmann::json request = nlohmann::json::object();
            this->send(request);
            connection.write(m_message_type, request);

            while (true)
            {
                auto const packet = connection.read();
                auto const type = packet.at("type").get<core::MessageType>();
                auto const payload = packet.value("payload", nlohmann::json::object());

                if (type == core::MessageType::Error)
                {
                    m_error = std::format("{}: {}", payload.at("code").get<std::string>(),
                                          payload.at("message").get<std::string>());
                    return true;
                }

                if (this->accept(type, payload))
                {
                    return true;
                }

                if (type == core::MessageType::Settlement || type == core::MessageType::Expired ||
                    type == core::MessageType::Resolved)
                {
                    std::cout << "\n[server] " << packet.dump() << "\n" << std::endl;
                }
            }
        }
        catch (nlohmann::json::exception const&)
        {
            return false;
        }
        catch (boost::system::system_error const& e)
        {
            m_error = std::format("connection closed: {}", e.code().message());
            connection.close();
            return false;
        }
    }
} // namespace house
