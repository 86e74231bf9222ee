#include "wallet.hpp"
#include "core/logging.hpp"
#include "precompiled.hpp"
#include <limits>

namespace house::modules
{
    namespace
    {
        // Balances are stored as SQLite INTEGER; available + reserved never exceeds this.
        constexpr int64_t kMaxBalance = std::numeric_limits<int64_t>::max();
    } // namespace

    Wallet::Wallet(SQLite::Database& database, std::optional<std::filesystem::path> const log_path)
        : m_database(&database), m_logger(core::create_logger("wallet", log_path))
    {
        try
        {
            if (!database.tableExists("balances"))
            {
                SQLite::Statement statement(*m_database, "CREATE TABLE balances (player_id TEXT PRIMARY KEY, "
                                                         "available INTEGER NOT NULL, reserved INTEGER NOT NULL)");
                statement.exec();
            }

            if (!database.tableExists("transactions"))
            {
                SQLite::Statement statement(*m_database,
                                            "CREATE TABLE transactions (id INTEGER PRIMARY KEY, player_id TEXT, "
                                            "amount INTEGER, transaction_type INTEGER, description TEXT)");
                statement.exec();
            }
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::critical, e.what());
            throw;
        }
    }

    auto Wallet::deposit(std::string_view const player_id, uint64_t const amount) -> bool
    {
        if (amount == 0 || amount > static_cast<uint64_t>(kMaxBalance))
        {
            return false;
        }

        try
        {
            SQLite::Transaction transaction(*m_database);

            SQLite::Statement statement(*m_database,
                                        "INSERT INTO balances (player_id, available, reserved) VALUES (?1, ?2, 0) "
                                        "ON CONFLICT(player_id) DO UPDATE SET "
                                        "available = available + excluded.available "
                                        "WHERE available + reserved <= ?3 - excluded.available");
            statement.bind(1, std::string(player_id));
            statement.bind(2, static_cast<int64_t>(amount));
            statement.bind(3, kMaxBalance);
            if (statement.exec() != 1)
            {
                m_logger->log(spdlog::level::warn, "Deposit of {} for player: {} exceeds the balance limit", amount,
                              player_id);
                return false;
            }

            this->record(player_id, amount, WalletTransactionType::Deposit, "Deposit");
            transaction.commit();

            m_logger->log(spdlog::level::debug, "Deposit of {} for player: {}", amount, player_id);
            return true;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto Wallet::reserve(std::string_view const player_id, uint64_t const amount, std::string_view const round_id)
        -> bool
    {
        try
        {
            SQLite::Transaction transaction(*m_database);

            SQLite::Statement statement(*m_database,
                                        "UPDATE balances SET available = available - ?, reserved = reserved + ? "
                                        "WHERE player_id = ? and available >= ?");
            statement.bind(1, static_cast<int64_t>(amount));
            statement.bind(2, static_cast<int64_t>(amount));
            statement.bind(3, std::string(player_id));
            statement.bind(4, static_cast<int64_t>(amount));
            if (statement.exec() != 1)
            {
                return false;
            }

            this->record(player_id, amount, WalletTransactionType::Reserve, round_id);
            transaction.commit();
            return true;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return false;
        }
    }

    auto Wallet::release(std::string_view const player_id, uint64_t const amount, std::string_view const round_id)
        -> bool
    {
        try
        {
            SQLite::Transaction transaction(*m_database);
            if (!this->refund(player_id, amount, round_id))
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

    auto Wallet::refund(std::string_view const player_id, uint64_t const amount, std::string_view const round_id)
        -> bool
    {
        SQLite::Statement statement(*m_database,
                                    "UPDATE balances SET available = available + ?, reserved = reserved - ? "
                                    "WHERE player_id = ? and reserved >= ?");
        statement.bind(1, static_cast<int64_t>(amount));
        statement.bind(2, static_cast<int64_t>(amount));
        statement.bind(3, std::string(player_id));
        statement.bind(4, static_cast<int64_t>(amount));
        if (statement.exec() != 1)
        {
            m_logger->log(spdlog::level::err, "Release of {} for round: {} found no reservation", amount, round_id);
            return false;
        }

        this->record(player_id, amount, WalletTransactionType::Release, round_id);
        m_logger->log(spdlog::level::debug, "Released {} for round: {}", amount, round_id);
        return true;
    }

    auto Wallet::settle(std::string_view const player_id, uint64_t const wager, uint64_t const payout,
                        std::string_view const round_id) -> bool
    {
        if (payout > static_cast<uint64_t>(kMaxBalance))
        {
            return false;
        }

        SQLite::Statement statement(*m_database,
                                    "UPDATE balances SET available = available + ?1, reserved = reserved - ?2 "
                                    "WHERE player_id = ?3 and reserved >= ?2 and available + reserved - ?2 <= ?4 - ?1");
        statement.bind(1, static_cast<int64_t>(payout));
        statement.bind(2, static_cast<int64_t>(wager));
        statement.bind(3, std::string(player_id));
        statement.bind(4, kMaxBalance);
        if (statement.exec() != 1)
        {
            return false;
        }

        this->record(player_id, wager, WalletTransactionType::Consume, round_id);
        if (payout > 0)
        {
            this->record(player_id, payout, WalletTransactionType::Payout, round_id);
        }
        return true;
    }

    auto Wallet::balance(std::string_view const player_id) -> std::optional<BalanceInfo>
    {
        try
        {
            SQLite::Statement statement(*m_database,
                                        "SELECT available, reserved FROM balances WHERE player_id = ?");
            statement.bind(1, std::string(player_id));

            if (!statement.executeStep())
            {
                return BalanceInfo{.player_id = std::string(player_id), .available = 0, .reserved = 0};
            }

            return BalanceInfo{.player_id = std::string(player_id),
                               .available = static_cast<uint64_t>(statement.getColumn(0).getInt64()),
                               .reserved = static_cast<uint64_t>(statement.getColumn(1).getInt64())};
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
            return std::nullopt;
        }
    }

    auto Wallet::record(std::string_view const player_id, uint64_t const amount,
                        WalletTransactionType const transaction_type, std::string_view const description) -> void
    {
        SQLite::Statement statement(*m_database, "INSERT INTO transactions (player_id, amount, "
                                                 "transaction_type, description) VALUES (?, ?, ?, ?)");
        statement.bind(1, std::string(player_id));
        statement.bind(2, static_cast<int64_t>(amount));
        statement.bind(3, static_cast<uint32_t>(transaction_type));
        statement.bind(4, std::string(description));
        statement.exec();
    }
} // namespace house::modules
