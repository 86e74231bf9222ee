#include "server.hpp"
#include "core/logging.hpp"
#include "ledger_source.hpp"
#include "precompiled.hpp"

namespace house
{
    Server::Server(Settings const& settings)
        : m_settings(settings), m_log_path(settings.log_path),
          m_logger(core::create_logger("server", m_log_path)),
          m_session_logger(core::create_logger("session", m_log_path)),
          m_database(settings.database_path.string(), SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE),
          m_wallet(m_database, m_log_path), m_rounds(m_database, m_log_path),
          m_vault(settings.ledger_path
                      ? std::make_unique<modules::VaultLedger>(
                            m_io_context, m_database, file_ledger_query(settings.ledger_path.value()),
                            modules::VaultSettings{.refresh_interval = settings.ledger_interval,
                                                   .stale_after = settings.stale_after,
                                                   .history_size = settings.history_size},
                            m_log_path)
                      : nullptr),
          m_pipeline(m_io_context, m_database, m_wallet, m_rounds, m_vault.get(),
                     modules::RetryPolicy{.max_attempts = settings.max_attempts,
                                          .base_delay = settings.retry_base,
                                          .max_delay = settings.retry_cap},
                     settings.settle_interval, m_log_path),
          m_gateway(m_wallet, m_rounds, m_pipeline, m_vault.get(), m_registry,
                    GatewaySettings{.house_edge_bps = settings.house_edge_bps,
                                    .max_wager_divisor = settings.max_wager_divisor,
                                    .round_timeout = settings.round_timeout},
                    m_log_path),
          m_acceptor(m_io_context, boost::asio::ip::tcp::endpoint(boost::asio::ip::tcp::v4(), settings.port)),
          m_signals(m_io_context, SIGINT, SIGTERM), m_session_index(0)
    {
        m_logger->log(spdlog::level::info, "Server starting (database: {}, house edge: {} bps)",
                      settings.database_path.string(), settings.house_edge_bps);
        if (!m_vault)
        {
            m_logger->log(spdlog::level::warn, "No ledger export configured, payouts above the wager skip the "
                                               "custody solvency check");
        }
    }

    auto Server::run() -> void
    {
        this->recover();

        m_pipeline.start();
        if (m_vault)
        {
            m_vault->start();
        }

        m_signals.async_wait([this](boost::system::error_code const& error, int const signal_number) {
            if (!error)
            {
                m_logger->log(spdlog::level::info, "Signal {} received, shutting down", signal_number);
                this->stop();
            }
        });

        m_logger->log(spdlog::level::info, "Server is running! ::{}", m_acceptor.local_endpoint().port());

        this->accept_connection();
        m_io_context.run();

        m_logger->log(spdlog::level::info, "Server stopped");
    }

    auto Server::stop() -> void
    {
        boost::system::error_code error;
        m_acceptor.close(error);
        m_signals.cancel(error);

        m_pipeline.stop();
        if (m_vault)
        {
            m_vault->stop();
        }

        for (auto const& [session_id, session] : m_sessions)
        {
            session->stop();
        }
    }

    auto Server::recover() -> void
    {
        auto const now = modules::Clock::now();
        for (auto const& round : m_rounds.expire_orphans(now))
        {
            if (!m_wallet.release(round.player_id, round.wager, round.round_id))
            {
                m_logger->log(spdlog::level::err, "Round {} expired without a reservation to release",
                              round.round_id);
            }
        }
        m_pipeline.recover(now);

        if (m_settings.pool_seed && m_pipeline.seed_pool(m_settings.pool_seed.value()))
        {
            m_logger->log(spdlog::level::info, "House pool funded with {}", m_settings.pool_seed.value());
        }

        if (auto const pool_balance = m_pipeline.pool_balance())
        {
            m_logger->log(spdlog::level::info, "House pool balance: {}", pool_balance.value());
        }
        else
        {
            m_logger->log(spdlog::level::warn, "House pool is not funded, wagers will be refused");
        }
    }

    auto Server::accept_connection() -> void
    {
        m_acceptor.async_accept(
            boost::asio::make_strand(m_io_context),
            [this](boost::system::error_code const& error, boost::asio::ip::tcp::socket&& socket) {
                if (error)
                {
                    if (error != boost::asio::error::operation_aborted)
                    {
                        m_logger->log(spdlog::level::err, "Accept failed: {}", error.message());
                        this->accept_connection();
                    }
                    return;
                }

                boost::system::error_code endpoint_error;
                auto const remote_endpoint = socket.remote_endpoint(endpoint_error);

                auto session =
                    std::make_shared<Session>(std::move(socket), m_session_index,
                                              SessionSettings{.heartbeat_interval = m_settings.heartbeat_interval,
                                                              .heartbeat_timeout = m_settings.heartbeat_timeout},
                                              m_session_logger);
                session->on_connected = [remote_endpoint, this](uint64_t const session_id) {
                    m_logger->log(spdlog::level::trace, "Client {}:{} is connected (session {})",
                                  remote_endpoint.address().to_string(), remote_endpoint.port(), session_id);
                };
                session->on_closed = [remote_endpoint, this](PlayerContext& context) {
                    m_logger->log(spdlog::level::trace, "Client {}:{} is disconnected (session {})",
                                  remote_endpoint.address().to_string(), remote_endpoint.port(), context.session_id);
                    m_gateway.on_closed(context, modules::Clock::now());
                    this->close_connection(context.session_id);
                };
                session->on_message = [this](PlayerContext& context, std::string_view const line) -> Response {
                    return m_gateway.on_message(context, line, modules::Clock::now());
                };
                session->on_tick = [this](PlayerContext& context) -> std::vector<Response> {
                    return m_gateway.on_tick(context, modules::Clock::now());
                };
                session->start();

                m_sessions[m_session_index++] = std::move(session);

                this->accept_connection();
            });
    }

    auto Server::close_connection(uint64_t const session_id) -> void
    {
        m_sessions.erase(session_id);
    }
} // namespace house
