#include "rounds.hpp"
#include "core/logging.hpp"
#include "precompiled.hpp"

namespace house::modules
{
    Rounds::Rounds(SQLite::Database& database, std::optional<std::filesystem::path> const log_path)
        : m_database(&database), m_logger(core::create_logger("rounds", log_path))
    {
        if (!database.tableExists("rounds"))
        {
            try
            {
                SQLite::Statement statement(
                    *m_database,
                    "CREATE TABLE rounds (round_id TEXT PRIMARY KEY, player_id TEXT NOT NULL, wager INTEGER NOT NULL, "
                    "choice INTEGER NOT NULL, commitment TEXT NOT NULL, house_nonce TEXT NOT NULL, "
                    "house_commitment TEXT NOT NULL, house_edge_bps INTEGER NOT NULL, player_nonce TEXT, "
                    "outcome INTEGER, won INTEGER NOT NULL, payout INTEGER NOT NULL, state INTEGER NOT NULL, "
                    "committed_at INTEGER NOT NULL, last_activity INTEGER NOT NULL, revealed_at INTEGER, "
                    "settled_at INTEGER)");
                statement.exec();
            }
            catch (SQLite::Exception const& e)
            {
                m_logger->log(spdlog::level::critical, e.what());
                throw;
            }
        }
    }

    auto Rounds::record_commitment(Round const& round) -> bool
    {
        try
        {
            SQLite::Statement statement(*m_database,
                                        "INSERT INTO rounds (round_id, player_id, wager, choice, commitment, "
                                        "house_nonce, house_commitment, house_edge_bps, won, payout, state, "
                                        "committed_at, last_activity) VALUES (?, ?, ?, ?, ?, ?, ?, ?, 0, 0, ?, ?, ?)");
            statement.bind(1, round.round_id);
            statement.bind(2, round.player_id);
            statement.bind(3, static_cast<int64_t>(round.wager));
            statement.bind(4, static_cast<uint32_t>(round.choice));
            statement.bind(5, round.commitment);
            statement.bind(6, round.house_nonce);
            statement.bind(7, round.house_commitment);
            statement.bind(8, round.house_edge_bps);
            statement.bind(9, static_cast<uint32_t>(round.state));
            statement.bind(10, to_millis(round.committed_at));
            statement.bind(11, to_millis(round.last_activity));
            return statement.exec() == 1;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto Rounds::record_outcome(Round const& round) -> bool
    {
        try
        {
            SQLite::Statement statement(*m_database,
                                        "UPDATE rounds SET player_nonce = ?, outcome = ?, won = ?, payout = ?, "
                                        "state = ?, last_activity = ?, revealed_at = ? WHERE round_id = ?");
            if (round.player_nonce)
            {
                statement.bind(1, round.player_nonce.value());
            }
            else
            {
                statement.bind(1);
            }
            if (round.outcome)
            {
                statement.bind(2, static_cast<uint32_t>(round.outcome.value()));
            }
            else
            {
                statement.bind(2);
            }
            statement.bind(3, round.won ? 1 : 0);
            statement.bind(4, static_cast<int64_t>(round.payout));
            statement.bind(5, static_cast<uint32_t>(round.state));
            statement.bind(6, to_millis(round.last_activity));
            if (round.revealed_at)
            {
                statement.bind(7, to_millis(round.revealed_at.value()));
            }
            else
            {
                statement.bind(7);
            }
            statement.bind(8, round.round_id);

            if (statement.exec() != 1)
            {
                m_logger->log(spdlog::level::err, "Round {} is not recorded", round.round_id);
                return false;
            }

            if (round.state == RoundState::Voided)
            {
                m_logger->log(spdlog::level::warn,
                              "Round {} voided: commitment {} not opened by nonce {} (player: {}, wager: {})",
                              round.round_id, round.commitment, round.player_nonce.value_or(""), round.player_id,
                              round.wager);
            }
            return true;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto Rounds::close(Round const& round, Wallet& wallet) -> bool
    {
        try
        {
            SQLite::Transaction transaction(*m_database);
            if (!this->record_outcome(round) || !wallet.refund(round.player_id, round.wager, round.round_id))
            {
                return false;
            }
            transaction.commit();
            return true;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto Rounds::mark_settled(std::string_view const round_id, Clock::time_point const now) -> bool
    {
        try
        {
            SQLite::Statement statement(*m_database, "UPDATE rounds SET state = ?, settled_at = ? "
                                                     "WHERE round_id = ? and state = ?");
            statement.bind(1, static_cast<uint32_t>(RoundState::Settled));
            statement.bind(2, to_millis(now));
            statement.bind(3, std::string(round_id));
            statement.bind(4, static_cast<uint32_t>(RoundState::Resolved));
            return statement.exec() == 1;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto Rounds::find(std::string_view const round_id) -> std::optional<Round>
    {
        try
        {
            SQLite::Statement statement(*m_database, "SELECT * FROM rounds WHERE round_id = ?");
            statement.bind(1, std::string(round_id));
            if (!statement.executeStep())
            {
                return std::nullopt;
            }
            return read_round(statement);
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return std::nullopt;
        }
    }

    auto Rounds::expire_orphans(Clock::time_point const now) -> std::vector<Round>
    {
        std::vector<Round> orphans;
        try
        {
            SQLite::Transaction transaction(*m_database);
            {
                SQLite::Statement statement(*m_database, "SELECT * FROM rounds WHERE state = ?");
                statement.bind(1, static_cast<uint32_t>(RoundState::AwaitingReveal));
                while (statement.executeStep())
                {
                    auto round = read_round(statement);
                    round.state = RoundState::Expired;
                    round.last_activity = now;
                    orphans.emplace_back(std::move(round));
                }
            }

            SQLite::Statement statement(*m_database, "UPDATE rounds SET state = ?, last_activity = ? WHERE state = ?");
            statement.bind(1, static_cast<uint32_t>(RoundState::Expired));
            statement.bind(2, to_millis(now));
            statement.bind(3, static_cast<uint32_t>(RoundState::AwaitingReveal));
            statement.exec();

            transaction.commit();
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return {};
        }

        if (!orphans.empty())
        {
            m_logger->log(spdlog::level::info, "Expired {} rounds left open by a previous run", orphans.size());
        }
        return orphans;
    }

    auto Rounds::read_round(SQLite::Statement& statement) -> Round
    {
        Round round{.round_id = statement.getColumn("round_id").getString(),
                    .player_id = statement.getColumn("player_id").getString(),
                    .wager = static_cast<uint64_t>(statement.getColumn("wager").getInt64()),
                    .choice = static_cast<core::CoinChoice>(statement.getColumn("choice").getUInt()),
                    .commitment = statement.getColumn("commitment").getString(),
                    .house_nonce = statement.getColumn("house_nonce").getString(),
                    .house_commitment = statement.getColumn("house_commitment").getString(),
                    .house_edge_bps = statement.getColumn("house_edge_bps").getUInt(),
                    .won = statement.getColumn("won").getInt() != 0,
                    .payout = static_cast<uint64_t>(statement.getColumn("payout").getInt64()),
                    .state = static_cast<RoundState>(statement.getColumn("state").getUInt()),
                    .committed_at = from_millis(statement.getColumn("committed_at").getInt64()),
                    .last_activity = from_millis(statement.getColumn("last_activity").getInt64())};

        if (!statement.getColumn("player_nonce").isNull())
        {
            round.player_nonce = statement.getColumn("player_nonce").getString();
        }
        if (!statement.getColumn("outcome").isNull())
        {
            round.outcome = static_cast<core::CoinChoice>(statement.getColumn("outcome").getUInt());
        }
        if (!statement.getColumn("revealed_at").isNull())
        {
            round.revealed_at = from_millis(statement.getColumn("revealed_at").getInt64());
        }
        if (!statement.getColumn("settled_at").isNull())
        {
            round.settled_at = from_millis(statement.getColumn("settled_at").getInt64());
        }
        return round;
    }
} // namespace house::modules
