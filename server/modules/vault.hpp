#pragma once

#include "game_session.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <spdlog/spdlog.h>
#include <vector>

namespace house::modules
{
    using Amount = boost::multiprecision::uint256_t;

    // Share price is kept as a fixed-point integer with this many fractional digits.
    constexpr uint32_t kSharePriceDecimals = 18;

    // Raw figures as reported by the custody layer, each in its own token's smallest unit.
    struct LedgerReading
    {
        Amount total_assets;
        Amount total_shares;
        uint32_t asset_decimals;
        uint32_t share_decimals;
    };

    // Read-only query against the custody pool. May block and may throw on transient failures.
    using LedgerQuery = std::function<LedgerReading()>;

    struct VaultSnapshot
    {
        Amount total_assets;
        Amount total_shares;
        uint32_t asset_decimals;
        uint32_t share_decimals;
        Amount share_price;
        Clock::time_point captured_at;
        bool is_stale = false;
    };

    auto to_json(nlohmann::json& json, VaultSnapshot const& snapshot) -> void;

    // (total_assets / 10^asset_decimals) / (total_shares / 10^share_decimals) scaled by 10^18; par when no shares.
    auto compute_share_price(LedgerReading const& reading) -> Amount;

    auto format_fixed(Amount const& value, uint32_t const decimals) -> std::string;

    struct VaultSettings
    {
        std::chrono::milliseconds refresh_interval{std::chrono::seconds(15)};
        std::chrono::milliseconds stale_after{std::chrono::seconds(60)};
        std::chrono::milliseconds persist_interval{std::chrono::minutes(5)};
        size_t history_size = 64;
    };

    class VaultLedger
    {
      public:
        VaultLedger(boost::asio::io_context& io_context, SQLite::Database& database, LedgerQuery query,
                    VaultSettings const& settings, std::optional<std::filesystem::path> const log_path);

        ~VaultLedger();

        // Runs the query on the caller's thread and applies the result. Returns false and keeps the
        // last known good snapshot when the query fails.
        auto refresh(Clock::time_point const now) -> bool;

        auto apply(LedgerReading const& reading, Clock::time_point const now) -> VaultSnapshot;

        auto latest_snapshot(Clock::time_point const now) const -> std::optional<VaultSnapshot>;

        auto history() const -> std::vector<VaultSnapshot>;

        auto consecutive_failures() const -> uint32_t;

        auto start() -> void;

        auto stop() -> void;

      private:
        SQLite::Database* m_database;
        LedgerQuery m_query;
        VaultSettings m_settings;
        std::shared_ptr<spdlog::logger> m_logger;

        mutable std::mutex m_mutex;
        std::deque<VaultSnapshot> m_history;
        uint32_t m_consecutive_failures;

        std::optional<VaultSnapshot> m_last_persisted;

        boost::asio::strand<boost::asio::io_context::executor_type> m_strand;
        boost::asio::steady_timer m_timer;
        boost::asio::thread_pool m_workers;
        std::atomic<bool> m_running;

        auto tick() -> void;

        auto schedule() -> void;

        auto on_failure(std::string_view const reason) -> void;

        auto should_persist(VaultSnapshot const& snapshot) const -> bool;

        auto persist(VaultSnapshot const& snapshot) -> void;

        auto load_last_persisted() -> void;
    };
} // namespace house::modules
