#pragma once

#include "core/common.hpp"
#include "modules/game_session.hpp"
#include <boost/asio.hpp>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <spdlog/spdlog.h>
#include <vector>

namespace house
{
    class Response
    {
      public:
        Response(core::MessageType const message_type, std::optional<nlohmann::json> payload);

        auto message_type() const -> core::MessageType;

        auto payload() const -> nlohmann::json const&;

        // One envelope per line
        auto serialize() const -> std::string;

      private:
        core::MessageType m_message_type;
        nlohmann::json m_payload;
    };

    // Per-connection state. The game session is created when the connection identifies itself.
    struct PlayerContext
    {
        uint64_t session_id;
        std::optional<modules::GameSession> game;
        // Resolved round whose outcome is not durably queued yet; retried on every tick.
        std::optional<modules::ResolvedRound> pending_handoff;
    };

    struct SessionSettings
    {
        std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(15)};
        std::chrono::milliseconds heartbeat_timeout{std::chrono::seconds(10)};
        size_t max_line_length = 16 * 1024;
    };

    // One player connection. Every handler runs on the socket's strand, so the player context is only
    // touched by one task at a time.
    class Session : public std::enable_shared_from_this<Session>
    {
      public:
        Session(boost::asio::ip::tcp::socket&& socket, uint64_t const session_id, SessionSettings const& settings,
                std::shared_ptr<spdlog::logger> logger);

        Session(Session const& other) = delete;

        auto operator=(Session const& other) -> Session& = delete;

        auto start() -> void;

        auto close() -> void;

        // Closes the connection from outside its strand.
        auto stop() -> void;

        auto send(Response const& response) -> void;

        auto session_id() const -> uint64_t;

        std::function<void(uint64_t const)> on_connected;

        std::function<void(PlayerContext&)> on_closed;

        std::function<Response(PlayerContext&, std::string_view const)> on_message;

        // Periodic housekeeping on the connection's strand (round inactivity, settlement notices).
        std::function<std::vector<Response>(PlayerContext&)> on_tick;

      private:
        boost::asio::ip::tcp::socket m_socket;
        boost::asio::steady_timer m_timer;
        SessionSettings m_settings;
        std::shared_ptr<spdlog::logger> m_logger;

        PlayerContext m_context;

        boost::asio::streambuf m_read_buffer;
        std::deque<std::string> m_write_queue;

        std::chrono::steady_clock::time_point m_last_inbound;
        std::optional<std::chrono::steady_clock::time_point> m_heartbeat_sent_at;
        bool m_closed;

        auto read_socket() -> void;

        auto write_socket() -> void;

        auto schedule_tick() -> void;

        auto tick() -> void;
    };
} // namespace house
