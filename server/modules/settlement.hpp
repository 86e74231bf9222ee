#pragma once

#include "game_session.hpp"
#include "rounds.hpp"
#include "vault.hpp"
#include "wallet.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <atomic>
#include <boost/asio.hpp>
#include <filesystem>
#include <spdlog/spdlog.h>

namespace house::modules
{
    enum class SettlementStatus : uint8_t
    {
        Pending,
        Retrying,
        Settled,
        Escalated
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(SettlementStatus, {{SettlementStatus::Pending, "Pending"},
                                                    {SettlementStatus::Retrying, "Retrying"},
                                                    {SettlementStatus::Settled, "Settled"},
                                                    {SettlementStatus::Escalated, "Escalated"}})

    enum class SettlementOutcome : uint8_t
    {
        Applied,
        Duplicate,
        Deferred,
        Escalated
    };

    struct RetryPolicy
    {
        uint32_t max_attempts = 5;
        std::chrono::milliseconds base_delay{std::chrono::seconds(2)};
        std::chrono::milliseconds max_delay{std::chrono::minutes(5)};

        // base_delay * 2^(attempts - 1), capped at max_delay
        auto delay(uint32_t const attempts) const -> std::chrono::milliseconds;
    };

    struct SettlementInfo
    {
        std::string round_id;
        std::string player_id;
        uint64_t wager;
        uint64_t payout;
        SettlementStatus status;
        uint32_t attempts;
        Clock::time_point next_attempt_at;
        std::string last_error;
    };

    // Durable queue of resolved rounds. Each round id is applied against the pool at most once: the
    // settled marker is set with a compare-and-set inside the same transaction that moves the balance.
    class SettlementPipeline
    {
      public:
        SettlementPipeline(boost::asio::io_context& io_context, SQLite::Database& database, Wallet& wallet,
                           Rounds& rounds, VaultLedger const* vault, RetryPolicy const& retry_policy,
                           std::chrono::milliseconds const poll_interval,
                           std::optional<std::filesystem::path> const log_path);

        ~SettlementPipeline();

        // Durable acknowledgment of the hand-off. Re-checks the fairness proof and the payout bound, then
        // records the outcome and the queue row in one transaction.
        auto enqueue(ResolvedRound const& resolved, Clock::time_point const now) -> bool;

        // Queues resolved rounds that have no queue row. Returns how many were queued.
        auto recover(Clock::time_point const now) -> size_t;

        auto apply(std::string_view const round_id, Clock::time_point const now) -> SettlementOutcome;

        // Applies every row whose retry time has come. Returns how many were settled.
        auto process_due(Clock::time_point const now) -> size_t;

        auto status(std::string_view const round_id) -> std::optional<SettlementStatus>;

        auto info(std::string_view const round_id) -> std::optional<SettlementInfo>;

        auto pool_balance() -> std::optional<uint64_t>;

        // Stores the initial pool balance when none exists yet.
        auto seed_pool(uint64_t const amount) -> bool;

        auto start() -> void;

        auto stop() -> void;

      private:
        SQLite::Database* m_database;
        Wallet* m_wallet;
        Rounds* m_rounds;
        VaultLedger const* m_vault;
        RetryPolicy m_retry_policy;
        std::chrono::milliseconds m_poll_interval;
        std::shared_ptr<spdlog::logger> m_logger;

        boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
        boost::asio::steady_timer m_timer;
        std::atomic<bool> m_running;

        auto tick() -> void;

        auto schedule() -> void;

        auto verify(Round const& round) -> bool;

        // Runs inside the caller's transaction. Throws SQLite::Exception.
        auto insert(Round const& round, Clock::time_point const now) -> void;

        auto wake() -> void;

        auto record_failure(std::string_view const round_id, uint32_t const attempts, core::ErrorCode const error_code,
                            std::string_view const reason, Clock::time_point const now) -> SettlementOutcome;
    };
} // namespace house::modules
