#include "helpers.hpp"
#include "modules/vault.hpp"
#include "precompiled.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

using namespace house;

namespace
{
    auto const kNow = modules::Clock::time_point(std::chrono::seconds(1700000000));

    auto snapshot_rows(SQLite::Database& database) -> int64_t
    {
        SQLite::Statement statement(database, "SELECT COUNT(*) FROM vault_snapshots");
        statement.executeStep();
        return statement.getColumn(0).getInt64();
    }

    // Ledger double whose figures and failures are set by the test
    struct FakeLedger
    {
        modules::LedgerReading reading{.total_assets = 1960000,
                                       .total_shares = 1000000000,
                                       .asset_decimals = 6,
                                       .share_decimals = 9};
        bool failing = false;
        uint32_t calls = 0;

        auto query() -> modules::LedgerQuery
        {
            return [this]() {
                ++calls;
                if (failing)
                {
                    throw std::runtime_error("custody node unreachable");
                }
                return reading;
            };
        }
    };
} // namespace

TEST(Vault, SharePriceAtPar_Test)
{
    auto const price = modules::compute_share_price(
        modules::LedgerReading{.total_assets = 0, .total_shares = 0, .asset_decimals = 6, .share_decimals = 9});
    ASSERT_EQ(modules::format_fixed(price, modules::kSharePriceDecimals), "1.000000000000000000");

    // Assets without shares are still priced at par
    auto const unissued = modules::compute_share_price(
        modules::LedgerReading{.total_assets = 500, .total_shares = 0, .asset_decimals = 6, .share_decimals = 6});
    ASSERT_EQ(unissued, modules::Amount("1000000000000000000"));
}

TEST(Vault, SharePriceNormalizesDecimals_Test)
{
    auto const price = modules::compute_share_price(modules::LedgerReading{
        .total_assets = 1960000, .total_shares = 1000000000, .asset_decimals = 6, .share_decimals = 9});
    ASSERT_EQ(modules::format_fixed(price, modules::kSharePriceDecimals), "1.960000000000000000");

    auto const fractional = modules::compute_share_price(
        modules::LedgerReading{.total_assets = 1, .total_shares = 3, .asset_decimals = 0, .share_decimals = 0});
    ASSERT_EQ(modules::format_fixed(fractional, modules::kSharePriceDecimals), "0.333333333333333333");

    // 18-decimal shares over 6-decimal assets
    auto const wide = modules::compute_share_price(modules::LedgerReading{
        .total_assets = modules::Amount("2500000"),
        .total_shares = modules::Amount("1000000000000000000"),
        .asset_decimals = 6,
        .share_decimals = 18});
    ASSERT_EQ(modules::format_fixed(wide, modules::kSharePriceDecimals), "2.500000000000000000");

    ASSERT_THROW(modules::compute_share_price(modules::LedgerReading{
                     .total_assets = 1, .total_shares = 1, .asset_decimals = 80, .share_decimals = 6}),
                 std::invalid_argument);
}

TEST(Vault, FormatFixed_Test)
{
    ASSERT_EQ(modules::format_fixed(5, 0), "5");
    ASSERT_EQ(modules::format_fixed(5, 3), "0.005");
    ASSERT_EQ(modules::format_fixed(12345, 2), "123.45");
    ASSERT_EQ(modules::format_fixed(0, 2), "0.00");
}

TEST(Vault, RefreshKeepsLastKnownGood_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;
    modules::VaultLedger vault(io_context, test_db, ledger.query(), modules::VaultSettings{}, std::nullopt);

    ASSERT_FALSE(vault.latest_snapshot(kNow));

    ledger.failing = true;
    ASSERT_FALSE(vault.refresh(kNow));
    ASSERT_FALSE(vault.latest_snapshot(kNow));
    ASSERT_EQ(vault.consecutive_failures(), 1u);

    ledger.failing = false;
    ASSERT_TRUE(vault.refresh(kNow));
    ASSERT_EQ(vault.consecutive_failures(), 0u);

    ledger.failing = true;
    ASSERT_FALSE(vault.refresh(kNow + std::chrono::seconds(15)));
    ASSERT_FALSE(vault.refresh(kNow + std::chrono::seconds(30)));
    ASSERT_EQ(vault.consecutive_failures(), 2u);

    auto const snapshot = vault.latest_snapshot(kNow + std::chrono::seconds(30));
    ASSERT_TRUE(snapshot);
    ASSERT_TRUE(snapshot->captured_at == kNow);
    ASSERT_EQ(snapshot->total_assets, modules::Amount(1960000));
    ASSERT_EQ(modules::format_fixed(snapshot->share_price, modules::kSharePriceDecimals), "1.960000000000000000");
    ASSERT_FALSE(snapshot->is_stale);
    ASSERT_EQ(ledger.calls, 4u);
}

TEST(Vault, StaleFlag_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;
    modules::VaultLedger vault(io_context, test_db, ledger.query(),
                               modules::VaultSettings{.stale_after = std::chrono::seconds(60)}, std::nullopt);

    ASSERT_TRUE(vault.refresh(kNow));
    ASSERT_FALSE(vault.latest_snapshot(kNow + std::chrono::seconds(60))->is_stale);
    ASSERT_TRUE(vault.latest_snapshot(kNow + std::chrono::seconds(61))->is_stale);

    // The flag is computed on read; history keeps the raw snapshots
    ASSERT_FALSE(vault.history().back().is_stale);
}

TEST(Vault, BoundedHistory_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;
    modules::VaultLedger vault(io_context, test_db, ledger.query(), modules::VaultSettings{.history_size = 3},
                               std::nullopt);

    for (uint32_t const i : std::views::iota(1u, 6u))
    {
        vault.apply(modules::LedgerReading{.total_assets = i * 1000,
                                           .total_shares = 1000,
                                           .asset_decimals = 6,
                                           .share_decimals = 6},
                    kNow + std::chrono::seconds(i));
    }

    auto const history = vault.history();
    ASSERT_EQ(history.size(), 3u);
    ASSERT_EQ(history.front().total_assets, modules::Amount(3000));
    ASSERT_EQ(history.back().total_assets, modules::Amount(5000));
    ASSERT_TRUE(std::ranges::is_sorted(history, {}, &modules::VaultSnapshot::captured_at));
    ASSERT_EQ(vault.latest_snapshot(kNow)->total_assets, modules::Amount(5000));
}

TEST(Vault, PersistsOnChange_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;
    modules::VaultLedger vault(io_context, test_db, ledger.query(), modules::VaultSettings{}, std::nullopt);

    ASSERT_TRUE(vault.refresh(kNow));
    ASSERT_EQ(snapshot_rows(test_db), 1);

    // Unchanged figures within the persistence interval are not written again
    ASSERT_TRUE(vault.refresh(kNow + std::chrono::seconds(15)));
    ASSERT_EQ(snapshot_rows(test_db), 1);

    ledger.reading.total_assets = 1970000;
    ASSERT_TRUE(vault.refresh(kNow + std::chrono::seconds(30)));
    ASSERT_EQ(snapshot_rows(test_db), 2);

    ASSERT_TRUE(vault.refresh(kNow + std::chrono::minutes(6)));
    ASSERT_EQ(snapshot_rows(test_db), 3);
}

TEST(Vault, RestoresPersistedSnapshot_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;

    {
        modules::VaultLedger vault(io_context, test_db, ledger.query(), modules::VaultSettings{}, std::nullopt);
        ASSERT_TRUE(vault.refresh(kNow));
    }

    ledger.failing = true;
    modules::VaultLedger restarted(io_context, test_db, ledger.query(), modules::VaultSettings{}, std::nullopt);
    ASSERT_FALSE(restarted.refresh(kNow + std::chrono::seconds(10)));

    auto const snapshot = restarted.latest_snapshot(kNow + std::chrono::seconds(10));
    ASSERT_TRUE(snapshot);
    ASSERT_EQ(snapshot->total_shares, modules::Amount(1000000000));
    ASSERT_EQ(snapshot->asset_decimals, 6u);
    ASSERT_EQ(snapshot->share_decimals, 9u);
    ASSERT_EQ(modules::format_fixed(snapshot->share_price, modules::kSharePriceDecimals), "1.960000000000000000");
}

TEST(Vault, SnapshotJson_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;
    modules::VaultLedger vault(io_context, test_db, ledger.query(), modules::VaultSettings{}, std::nullopt);
    ASSERT_TRUE(vault.refresh(kNow));

    nlohmann::json const json = vault.latest_snapshot(kNow).value();
    ASSERT_EQ(json.at("totalAssets").get<std::string>(), "1960000");
    ASSERT_EQ(json.at("totalShares").get<std::string>(), "1000000000");
    ASSERT_EQ(json.at("sharePrice").get<std::string>(), "1.960000000000000000");
    ASSERT_EQ(json.at("capturedAt").get<int64_t>(), 1700000000000);
    ASSERT_FALSE(json.at("isStale").get<bool>());
}

TEST(Vault, PeriodicRefresh_Test)
{
    boost::asio::io_context io_context;
    auto test_db = fixtures::memory_database();
    FakeLedger ledger;
    modules::VaultLedger vault(io_context, test_db, ledger.query(),
                               modules::VaultSettings{.refresh_interval = std::chrono::milliseconds(20)},
                               std::nullopt);

    vault.start();
    io_context.run_for(std::chrono::milliseconds(300));
    vault.stop();

    ASSERT_TRUE(vault.latest_snapshot(modules::Clock::now()));
    ASSERT_GE(vault.history().size(), 2u);
}
