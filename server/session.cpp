#include "session.hpp"
#include "precompiled.hpp"

namespace house
{
    Response::Response(core::MessageType const message_type, std::optional<nlohmann::json> payload)
        : m_message_type(message_type), m_payload(payload.value_or(nlohmann::json::object()))
    {
    }

    auto Response::message_type() const -> core::MessageType
    {
        return m_message_type;
    }

    auto Response::payload() const -> nlohmann::json const&
    {
        return m_payload;
    }

    auto Response::serialize() const -> std::string
    {
        nlohmann::json packet;
        packet["type"] = m_message_type;
        packet["payload"] = m_payload;
        return packet.dump() + '\n';
    }

    Session::Session(boost::asio::ip::tcp::socket&& socket, uint64_t const session_id,
                     SessionSettings const& settings, std::shared_ptr<spdlog::logger> logger)
        : m_socket(std::move(socket)), m_timer(m_socket.get_executor()), m_settings(settings),
          m_logger(std::move(logger)), m_context{.session_id = session_id},
          m_read_buffer(settings.max_line_length), m_last_inbound(std::chrono::steady_clock::now()),
          m_closed(false)
    {
    }

    auto Session::session_id() const -> uint64_t
    {
        return m_context.session_id;
    }

    auto Session::start() -> void
    {
        boost::asio::post(m_socket.get_executor(), [self = this->shared_from_this()]() {
            if (self->on_connected)
            {
                self->on_connected(self->m_context.session_id);
            }

            self->read_socket();
            self->schedule_tick();
        });
    }

    auto Session::close() -> void
    {
        if (m_closed)
        {
            return;
        }
        m_closed = true;

        boost::system::error_code error;
        m_socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, error);
        m_socket.close(error);
        m_timer.cancel();

        if (on_closed)
        {
            on_closed(m_context);
        }
    }

    auto Session::stop() -> void
    {
        boost::asio::post(m_socket.get_executor(), [self = this->shared_from_this()]() { self->close(); });
    }

    auto Session::send(Response const& response) -> void
    {
        if (m_closed)
        {
            return;
        }

        bool const idle = m_write_queue.empty();
        m_write_queue.emplace_back(response.serialize());
        if (idle)
        {
            this->write_socket();
        }
    }

    auto Session::read_socket() -> void
    {
        boost::asio::async_read_until(
            m_socket, m_read_buffer, '\n',
            [self = this->shared_from_this()](boost::system::error_code const& error, size_t const size) -> void {
                if (error)
                {
                    if (error != boost::asio::error::eof && error != boost::asio::error::operation_aborted)
                    {
                        self->m_logger->log(spdlog::level::debug, "Session {} read failed: {}",
                                            self->m_context.session_id, error.message());
                    }
                    self->close();
                    return;
                }

                std::string line(boost::asio::buffers_begin(self->m_read_buffer.data()),
                                 boost::asio::buffers_begin(self->m_read_buffer.data()) + size - 1);
                self->m_read_buffer.consume(size);
                boost::algorithm::trim(line);

                self->m_last_inbound = std::chrono::steady_clock::now();
                self->m_heartbeat_sent_at.reset();

                if (!line.empty() && self->on_message)
                {
                    self->send(self->on_message(self->m_context, line));
                }

                if (!self->m_closed)
                {
                    self->read_socket();
                }
            });
    }

    auto Session::write_socket() -> void
    {
        boost::asio::async_write(
            m_socket, boost::asio::buffer(m_write_queue.front()),
            [self = this->shared_from_this()](boost::system::error_code const& error, size_t const) -> void {
                if (error)
                {
                    self->close();
                    return;
                }

                self->m_write_queue.pop_front();
                if (!self->m_write_queue.empty())
                {
                    self->write_socket();
                }
            });
    }

    auto Session::schedule_tick() -> void
    {
        if (m_closed)
        {
            return;
        }

        m_timer.expires_after(std::min(m_settings.heartbeat_interval, m_settings.heartbeat_timeout));
        m_timer.async_wait([self = this->shared_from_this()](boost::system::error_code const& error) {
            if (!error)
            {
                self->tick();
            }
        });
    }

    auto Session::tick() -> void
    {
        auto const now = std::chrono::steady_clock::now();

        if (m_heartbeat_sent_at && now - m_heartbeat_sent_at.value() >= m_settings.heartbeat_timeout)
        {
            m_logger->log(spdlog::level::info, "Session {} did not answer the heartbeat, closing",
                          m_context.session_id);
            this->close();
            return;
        }

        if (on_tick)
        {
            for (auto const& response : on_tick(m_context))
            {
                this->send(response);
            }
        }

        if (!m_heartbeat_sent_at && now - m_last_inbound >= m_settings.heartbeat_interval)
        {
            m_heartbeat_sent_at = now;
            this->send(Response(core::MessageType::Heartbeat, std::nullopt));
        }

        this->schedule_tick();
    }
} // namespace house
