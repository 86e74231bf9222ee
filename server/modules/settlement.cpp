#include "settlement.hpp"
#include "core/fairness.hpp"
#include "core/logging.hpp"
#include "precompiled.hpp"

namespace house::modules
{
    auto RetryPolicy::delay(uint32_t const attempts) const -> std::chrono::milliseconds
    {
        auto delay = base_delay;
        for (uint32_t i = 1; i < attempts && delay < max_delay; ++i)
        {
            delay *= 2;
        }
        return std::min(delay, max_delay);
    }

    SettlementPipeline::SettlementPipeline(boost::asio::io_context& io_context, SQLite::Database& database,
                                           Wallet& wallet, Rounds& rounds, VaultLedger const* vault,
                                           RetryPolicy const& retry_policy,
                                           std::chrono::milliseconds const poll_interval,
                                           std::optional<std::filesystem::path> const log_path)
        : m_database(&database), m_wallet(&wallet), m_rounds(&rounds), m_vault(vault), m_retry_policy(retry_policy),
          m_poll_interval(poll_interval), m_logger(core::create_logger("settlement", log_path)),
          m_strand(boost::asio::make_strand(io_context)), m_timer(m_strand), m_running(false)
    {
        try
        {
            if (!database.tableExists("settlements"))
            {
                SQLite::Statement statement(
                    *m_database,
                    "CREATE TABLE settlements (round_id TEXT PRIMARY KEY, player_id TEXT NOT NULL, "
                    "wager INTEGER NOT NULL, payout INTEGER NOT NULL, status INTEGER NOT NULL, "
                    "attempts INTEGER NOT NULL, next_attempt_at INTEGER NOT NULL, enqueued_at INTEGER NOT NULL, "
                    "settled_at INTEGER, last_error TEXT)");
                statement.exec();
            }

            if (!database.tableExists("pool"))
            {
                SQLite::Statement statement(*m_database, "CREATE TABLE pool (id INTEGER PRIMARY KEY CHECK (id = 0), "
                                                         "balance INTEGER NOT NULL CHECK (balance >= 0))");
                statement.exec();
            }
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::critical, e.what());
            throw;
        }
    }

    SettlementPipeline::~SettlementPipeline()
    {
        this->stop();
    }

    auto SettlementPipeline::enqueue(ResolvedRound const& resolved, Clock::time_point const now) -> bool
    {
        auto const& round = resolved.round();
        if (!this->verify(round))
        {
            return false;
        }

        // The outcome and the queue row commit together, so a resolved round is always queued.
        try
        {
            SQLite::Transaction transaction(*m_database);

            // A repeated delivery leaves the recorded outcome and the queue row as they are.
            SQLite::Statement queued(*m_database, "SELECT 1 FROM settlements WHERE round_id = ?");
            queued.bind(1, round.round_id);
            if (queued.executeStep())
            {
                return true;
            }

            if (!m_rounds->record_outcome(round))
            {
                return false;
            }
            this->insert(round, now);
            transaction.commit();
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, "Round {} was not queued: {}", round.round_id, e.what());
            return false;
        }

        m_logger->log(spdlog::level::debug, "Queued round {} (player: {}, wager: {}, payout: {})", round.round_id,
                      round.player_id, round.wager, round.payout);
        this->wake();
        return true;
    }

    auto SettlementPipeline::recover(Clock::time_point const now) -> size_t
    {
        std::vector<std::string> unqueued;
        try
        {
            SQLite::Statement statement(*m_database,
                                        "SELECT rounds.round_id FROM rounds LEFT JOIN settlements "
                                        "ON settlements.round_id = rounds.round_id "
                                        "WHERE rounds.state = ? and settlements.round_id IS NULL");
            statement.bind(1, static_cast<uint32_t>(RoundState::Resolved));
            while (statement.executeStep())
            {
                unqueued.emplace_back(statement.getColumn(0).getString());
            }
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return 0;
        }

        size_t queued = 0;
        for (auto const& round_id : unqueued)
        {
            auto const round = m_rounds->find(round_id);
            if (!round || !this->verify(round.value()))
            {
                m_logger->log(spdlog::level::critical, "Resolved round {} is held for operator review", round_id);
                continue;
            }

            try
            {
                this->insert(round.value(), now);
                ++queued;
            }
            catch (SQLite::Exception const& e)
            {
                m_logger->log(spdlog::level::err, "Round {} was not queued: {}", round_id, e.what());
            }
        }

        if (queued > 0)
        {
            m_logger->log(spdlog::level::info, "Queued {} resolved rounds a previous run left unqueued", queued);
            this->wake();
        }
        return queued;
    }

    auto SettlementPipeline::apply(std::string_view const round_id, Clock::time_point const now) -> SettlementOutcome
    {
        std::string player_id;
        uint64_t wager;
        uint64_t payout;
        uint32_t attempts;
        {
            SQLite::Statement statement(*m_database, "SELECT player_id, wager, payout, status, attempts "
                                                     "FROM settlements WHERE round_id = ?");
            statement.bind(1, std::string(round_id));
            if (!statement.executeStep())
            {
                m_logger->log(spdlog::level::err, "Round {} is not queued for settlement", round_id);
                return SettlementOutcome::Duplicate;
            }

            auto const status = static_cast<SettlementStatus>(statement.getColumn(3).getUInt());
            if (status == SettlementStatus::Settled)
            {
                return SettlementOutcome::Duplicate;
            }
            if (status == SettlementStatus::Escalated)
            {
                return SettlementOutcome::Escalated;
            }

            player_id = statement.getColumn(0).getString();
            wager = static_cast<uint64_t>(statement.getColumn(1).getInt64());
            payout = static_cast<uint64_t>(statement.getColumn(2).getInt64());
            attempts = statement.getColumn(4).getUInt();
        }

        core::ErrorCode error_code = core::ErrorCode::Success;
        std::string reason;
        try
        {
            SQLite::Transaction transaction(*m_database);

            {
                SQLite::Statement statement(*m_database,
                                            "UPDATE settlements SET status = ?, settled_at = ?, attempts = ? "
                                            "WHERE round_id = ? and status IN (?, ?)");
                statement.bind(1, static_cast<uint32_t>(SettlementStatus::Settled));
                statement.bind(2, to_millis(now));
                statement.bind(3, attempts + 1);
                statement.bind(4, std::string(round_id));
                statement.bind(5, static_cast<uint32_t>(SettlementStatus::Pending));
                statement.bind(6, static_cast<uint32_t>(SettlementStatus::Retrying));
                if (statement.exec() != 1)
                {
                    return SettlementOutcome::Duplicate;
                }
            }

            if (payout > wager && m_vault)
            {
                auto const snapshot = m_vault->latest_snapshot(now);
                if (!snapshot || snapshot->is_stale)
                {
                    error_code = core::ErrorCode::TransientInfrastructureError;
                    reason = "vault snapshot is missing or stale";
                }
                else if (snapshot->total_assets < payout - wager)
                {
                    error_code = core::ErrorCode::SolvencyError;
                    reason = std::format("custody assets {} cannot cover {}", snapshot->total_assets.str(),
                                         payout - wager);
                }
            }

            if (error_code == core::ErrorCode::Success)
            {
                SQLite::Statement statement(*m_database, "UPDATE pool SET balance = balance + ?1 - ?2 "
                                                         "WHERE id = 0 and balance + ?1 >= ?2");
                statement.bind(1, static_cast<int64_t>(wager));
                statement.bind(2, static_cast<int64_t>(payout));
                if (statement.exec() != 1)
                {
                    error_code = core::ErrorCode::SolvencyError;
                    reason = std::format("pool cannot cover payout {}", payout);
                }
            }

            if (error_code == core::ErrorCode::Success && !m_wallet->settle(player_id, wager, payout, round_id))
            {
                error_code = core::ErrorCode::TransientInfrastructureError;
                reason = "player reservation is missing";
            }

            if (error_code == core::ErrorCode::Success && !m_rounds->mark_settled(round_id, now))
            {
                error_code = core::ErrorCode::TransientInfrastructureError;
                reason = "round is not recorded as resolved";
            }

            if (error_code == core::ErrorCode::Success)
            {
                transaction.commit();

                m_logger->log(spdlog::level::info, "Round {} settled: player: {}, wager: {}, payout: {}", round_id,
                              player_id, wager, payout);
                return SettlementOutcome::Applied;
            }
        }
        catch (SQLite::Exception const& e)
        {
            error_code = core::ErrorCode::TransientInfrastructureError;
            reason = e.what();
        }

        return this->record_failure(round_id, attempts + 1, error_code, reason, now);
    }

    auto SettlementPipeline::process_due(Clock::time_point const now) -> size_t
    {
        std::vector<std::string> due;
        {
            SQLite::Statement statement(*m_database, "SELECT round_id FROM settlements WHERE status IN (?, ?) "
                                                     "and next_attempt_at <= ? ORDER BY enqueued_at ASC");
            statement.bind(1, static_cast<uint32_t>(SettlementStatus::Pending));
            statement.bind(2, static_cast<uint32_t>(SettlementStatus::Retrying));
            statement.bind(3, to_millis(now));
            while (statement.executeStep())
            {
                due.emplace_back(statement.getColumn(0).getString());
            }
        }

        size_t settled = 0;
        for (auto const& round_id : due)
        {
            if (this->apply(round_id, now) == SettlementOutcome::Applied)
            {
                ++settled;
            }
        }
        return settled;
    }

    auto SettlementPipeline::status(std::string_view const round_id) -> std::optional<SettlementStatus>
    {
        auto const settlement_info = this->info(round_id);
        if (!settlement_info)
        {
            return std::nullopt;
        }
        return settlement_info->status;
    }

    auto SettlementPipeline::info(std::string_view const round_id) -> std::optional<SettlementInfo>
    {
        try
        {
            SQLite::Statement statement(*m_database,
                                        "SELECT round_id, player_id, wager, payout, status, attempts, "
                                        "next_attempt_at, last_error FROM settlements WHERE round_id = ?");
            statement.bind(1, std::string(round_id));
            if (!statement.executeStep())
            {
                return std::nullopt;
            }

            return SettlementInfo{.round_id = statement.getColumn(0).getString(),
                                  .player_id = statement.getColumn(1).getString(),
                                  .wager = static_cast<uint64_t>(statement.getColumn(2).getInt64()),
                                  .payout = static_cast<uint64_t>(statement.getColumn(3).getInt64()),
                                  .status = static_cast<SettlementStatus>(statement.getColumn(4).getUInt()),
                                  .attempts = statement.getColumn(5).getUInt(),
                                  .next_attempt_at = from_millis(statement.getColumn(6).getInt64()),
                                  .last_error = statement.getColumn(7).getString()};
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return std::nullopt;
        }
    }

    auto SettlementPipeline::pool_balance() -> std::optional<uint64_t>
    {
        try
        {
            SQLite::Statement statement(*m_database, "SELECT balance FROM pool WHERE id = 0");
            if (!statement.executeStep())
            {
                return std::nullopt;
            }
            return static_cast<uint64_t>(statement.getColumn(0).getInt64());
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return std::nullopt;
        }
    }

    auto SettlementPipeline::seed_pool(uint64_t const amount) -> bool
    {
        try
        {
            SQLite::Statement statement(*m_database, "INSERT OR IGNORE INTO pool (id, balance) VALUES (0, ?)");
            statement.bind(1, static_cast<int64_t>(amount));
            if (statement.exec() == 1)
            {
                m_logger->log(spdlog::level::info, "Pool seeded with {}", amount);
                return true;
            }
            return false;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto SettlementPipeline::start() -> void
    {
        boost::asio::post(m_strand, [this]() {
            if (m_running.exchange(true))
            {
                return;
            }

            try
            {
                SQLite::Statement statement(*m_database, "SELECT COUNT(*) FROM settlements WHERE status IN (?, ?)");
                statement.bind(1, static_cast<uint32_t>(SettlementStatus::Pending));
                statement.bind(2, static_cast<uint32_t>(SettlementStatus::Retrying));
                if (statement.executeStep())
                {
                    m_logger->log(spdlog::level::info, "Settlement worker started, {} rounds awaiting settlement",
                                  statement.getColumn(0).getInt64());
                }
            }
            catch (SQLite::Exception const& e)
            {
                m_logger->log(spdlog::level::err, e.what());
            }

            this->tick();
        });
    }

    auto SettlementPipeline::stop() -> void
    {
        if (m_running.exchange(false))
        {
            m_timer.cancel();
            m_logger->log(spdlog::level::info, "Settlement worker stopped");
        }
    }

    auto SettlementPipeline::tick() -> void
    {
        if (!m_running)
        {
            return;
        }

        try
        {
            auto const settled = this->process_due(Clock::now());
            if (settled > 0)
            {
                m_logger->log(spdlog::level::debug, "Settlement pass applied {} rounds", settled);
            }
        }
        catch (std::exception const& e)
        {
            m_logger->log(spdlog::level::err, "Settlement pass failed, retrying next tick: {}", e.what());
        }

        this->schedule();
    }

    auto SettlementPipeline::schedule() -> void
    {
        if (!m_running)
        {
            return;
        }

        m_timer.expires_after(m_poll_interval);
        m_timer.async_wait(boost::asio::bind_executor(m_strand, [this](boost::system::error_code const& error) {
            if (!error)
            {
                this->tick();
            }
        }));
    }

    auto SettlementPipeline::verify(Round const& round) -> bool
    {
        // The pipeline settles only what the fairness proof supports.
        bool const proof_holds = round.player_nonce && round.outcome &&
                                 core::is_hex32(round.player_nonce.value()) && core::is_hex32(round.house_nonce) &&
                                 core::verify_commitment(round.commitment, round.wager, round.choice,
                                                         round.player_nonce.value()) &&
                                 core::verify_house_commitment(round.house_commitment, round.house_nonce) &&
                                 core::derive_result(round.player_nonce.value(), round.house_nonce) ==
                                     round.outcome.value() &&
                                 round.won == (round.outcome.value() == round.choice);
        if (!proof_holds)
        {
            m_logger->log(spdlog::level::critical, "Refusing round {}: fairness proof does not hold", round.round_id);
            return false;
        }

        if (round.house_edge_bps > core::kBpsBase ||
            round.payout != core::calculate_payout(round.wager, round.won, round.house_edge_bps))
        {
            m_logger->log(spdlog::level::critical, "Refusing round {}: payout {} does not match wager {}",
                          round.round_id, round.payout, round.wager);
            return false;
        }
        return true;
    }

    auto SettlementPipeline::insert(Round const& round, Clock::time_point const now) -> void
    {
        SQLite::Statement statement(*m_database,
                                    "INSERT OR IGNORE INTO settlements (round_id, player_id, wager, payout, status, "
                                    "attempts, next_attempt_at, enqueued_at) VALUES (?, ?, ?, ?, ?, 0, ?, ?)");
        statement.bind(1, round.round_id);
        statement.bind(2, round.player_id);
        statement.bind(3, static_cast<int64_t>(round.wager));
        statement.bind(4, static_cast<int64_t>(round.payout));
        statement.bind(5, static_cast<uint32_t>(SettlementStatus::Pending));
        statement.bind(6, to_millis(now));
        statement.bind(7, to_millis(now));
        if (statement.exec() == 0)
        {
            m_logger->log(spdlog::level::debug, "Round {} is already queued", round.round_id);
        }
    }

    auto SettlementPipeline::wake() -> void
    {
        if (!m_running)
        {
            return;
        }

        boost::asio::post(m_strand, [this]() {
            try
            {
                this->process_due(Clock::now());
            }
            catch (std::exception const& e)
            {
                m_logger->log(spdlog::level::err, "Settlement pass failed: {}", e.what());
            }
        });
    }

    auto SettlementPipeline::record_failure(std::string_view const round_id, uint32_t const attempts,
                                            core::ErrorCode const error_code, std::string_view const reason,
                                            Clock::time_point const now) -> SettlementOutcome
    {
        bool const escalate = attempts >= m_retry_policy.max_attempts;
        auto const status = escalate ? SettlementStatus::Escalated : SettlementStatus::Retrying;
        auto const next_attempt_at = now + m_retry_policy.delay(attempts);
        auto const last_error = std::format("{}: {}", nlohmann::json(error_code).get<std::string>(), reason);

        try
        {
            SQLite::Statement statement(*m_database, "UPDATE settlements SET status = ?, attempts = ?, "
                                                     "next_attempt_at = ?, last_error = ? WHERE round_id = ?");
            statement.bind(1, static_cast<uint32_t>(status));
            statement.bind(2, attempts);
            statement.bind(3, to_millis(next_attempt_at));
            statement.bind(4, last_error);
            statement.bind(5, std::string(round_id));
            statement.exec();
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return SettlementOutcome::Deferred;
        }

        if (escalate)
        {
            m_logger->log(spdlog::level::critical, "Round {} needs manual intervention after {} attempts: {}", round_id,
                          attempts, last_error);
            return SettlementOutcome::Escalated;
        }

        m_logger->log(spdlog::level::warn, "Round {} settlement attempt {} failed, retrying in {} ms: {}", round_id,
                      attempts, m_retry_policy.delay(attempts).count(), last_error);
        return SettlementOutcome::Deferred;
    }
} // namespace house::modules
