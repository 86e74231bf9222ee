#pragma once

#include "game_session.hpp"
#include "wallet.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <filesystem>
#include <spdlog/spdlog.h>
#include <vector>

namespace house::modules
{
    // Durable audit trail of every round: commitments, both nonces and the derived outcome.
    class Rounds
    {
      public:
        Rounds(SQLite::Database& database, std::optional<std::filesystem::path> const log_path);

        // Durable acknowledgment of an accepted commitment.
        auto record_commitment(Round const& round) -> bool;

        // Stores the round as it is now (resolved, voided or expired).
        auto record_outcome(Round const& round) -> bool;

        // Records a voided or expired round and returns its wager in one transaction.
        auto close(Round const& round, Wallet& wallet) -> bool;

        auto mark_settled(std::string_view const round_id, Clock::time_point const now) -> bool;

        auto find(std::string_view const round_id) -> std::optional<Round>;

        // Rounds a previous process left open; they are expired and returned so reservations can be released.
        auto expire_orphans(Clock::time_point const now) -> std::vector<Round>;

      private:
        SQLite::Database* m_database;
        std::shared_ptr<spdlog::logger> m_logger;

        static auto read_round(SQLite::Statement& statement) -> Round;
    };
} // namespace house::modules
