#pragma once

#include "gateway.hpp"
#include "modules/rounds.hpp"
#include "modules/settlement.hpp"
#include "modules/vault.hpp"
#include "modules/wallet.hpp"
#include "registry.hpp"
#include "session.hpp"
#include "settings.hpp"

namespace house
{
    class Server
    {
      public:
        Server(Settings const& settings);

        auto run() -> void;

        auto stop() -> void;

      private:
        Settings m_settings;
        std::optional<std::filesystem::path> m_log_path;

        boost::asio::io_context m_io_context;
        std::shared_ptr<spdlog::logger> m_logger;
        std::shared_ptr<spdlog::logger> m_session_logger;

        SQLite::Database m_database;
        modules::Wallet m_wallet;
        modules::Rounds m_rounds;
        std::unique_ptr<modules::VaultLedger> m_vault;
        modules::SettlementPipeline m_pipeline;
        PlayerRegistry m_registry;
        Gateway m_gateway;

        boost::asio::ip::tcp::acceptor m_acceptor;
        boost::asio::signal_set m_signals;

        std::unordered_map<uint64_t, std::shared_ptr<Session>> m_sessions;
        uint64_t m_session_index;

        // Expires rounds a previous process left awaiting reveal, queues resolved rounds it left unqueued
        // and seeds the pool on first start.
        auto recover() -> void;

        auto accept_connection() -> void;

        auto close_connection(uint64_t const session_id) -> void;
    };
} // namespace house
