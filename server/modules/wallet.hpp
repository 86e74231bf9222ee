#pragma once

#include <SQLiteCpp/SQLiteCpp.h>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>

namespace house::modules
{
    enum class WalletTransactionType : uint32_t
    {
        Deposit,
        Reserve,
        Release,
        Consume,
        Payout
    };

    struct BalanceInfo
    {
        std::string player_id;
        uint64_t available;
        uint64_t reserved;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(BalanceInfo, player_id, available, reserved)

    // Player balances. A wager is moved from available to reserved when a round opens and stays there
    // until the round is settled (consumed) or expires/voids (released).
    class Wallet
    {
      public:
        Wallet(SQLite::Database& database, std::optional<std::filesystem::path> const log_path);

        auto deposit(std::string_view const player_id, uint64_t const amount) -> bool;

        auto reserve(std::string_view const player_id, uint64_t const amount, std::string_view const round_id)
            -> bool;

        auto release(std::string_view const player_id, uint64_t const amount, std::string_view const round_id)
            -> bool;

        // Returns a reserved wager. Runs inside the caller's transaction. Throws SQLite::Exception.
        auto refund(std::string_view const player_id, uint64_t const amount, std::string_view const round_id)
            -> bool;

        // Consumes the reserved wager and credits the payout. Runs inside the caller's transaction.
        auto settle(std::string_view const player_id, uint64_t const wager, uint64_t const payout,
                    std::string_view const round_id) -> bool;

        auto balance(std::string_view const player_id) -> std::optional<BalanceInfo>;

      private:
        SQLite::Database* m_database;
        std::shared_ptr<spdlog::logger> m_logger;

        auto record(std::string_view const player_id, uint64_t const amount,
                    WalletTransactionType const transaction_type, std::string_view const description) -> void;
    };
} // namespace house::modules
