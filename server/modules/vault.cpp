#include "vault.hpp"
#include "core/logging.hpp"
#include "precompiled.hpp"
#include <stdexcept>

namespace house::modules
{
    namespace
    {
        // Token decimals beyond this are not meaningful and would only inflate the arithmetic.
        constexpr uint32_t kMaxDecimals = 36;

        auto pow10(uint32_t const exponent) -> boost::multiprecision::cpp_int
        {
            return boost::multiprecision::pow(boost::multiprecision::cpp_int(10), exponent);
        }
    } // namespace

    auto to_json(nlohmann::json& json, VaultSnapshot const& snapshot) -> void
    {
        json["totalAssets"] = snapshot.total_assets.str();
        json["totalShares"] = snapshot.total_shares.str();
        json["assetDecimals"] = snapshot.asset_decimals;
        json["shareDecimals"] = snapshot.share_decimals;
        json["sharePrice"] = format_fixed(snapshot.share_price, kSharePriceDecimals);
        json["capturedAt"] = to_millis(snapshot.captured_at);
        json["isStale"] = snapshot.is_stale;
    }

    auto compute_share_price(LedgerReading const& reading) -> Amount
    {
        if (reading.asset_decimals > kMaxDecimals || reading.share_decimals > kMaxDecimals)
        {
            throw std::invalid_argument("token decimals out of range");
        }

        if (reading.total_shares == 0)
        {
            return static_cast<Amount>(pow10(kSharePriceDecimals));
        }

        auto const numerator = static_cast<boost::multiprecision::cpp_int>(reading.total_assets) *
                               pow10(reading.share_decimals) * pow10(kSharePriceDecimals);
        auto const denominator =
            static_cast<boost::multiprecision::cpp_int>(reading.total_shares) * pow10(reading.asset_decimals);
        boost::multiprecision::cpp_int const price = numerator / denominator;

        if (price > static_cast<boost::multiprecision::cpp_int>(std::numeric_limits<Amount>::max()))
        {
            throw std::overflow_error("share price does not fit 256 bits");
        }
        return static_cast<Amount>(price);
    }

    auto format_fixed(Amount const& value, uint32_t const decimals) -> std::string
    {
        std::string digits = value.str();
        if (decimals == 0)
        {
            return digits;
        }

        if (digits.size() <= decimals)
        {
            digits.insert(0, decimals + 1 - digits.size(), '0');
        }
        digits.insert(digits.size() - decimals, 1, '.');
        return digits;
    }

    VaultLedger::VaultLedger(boost::asio::io_context& io_context, SQLite::Database& database, LedgerQuery query,
                             VaultSettings const& settings, std::optional<std::filesystem::path> const log_path)
        : m_database(&database), m_query(std::move(query)), m_settings(settings),
          m_logger(core::create_logger("vault", log_path)), m_consecutive_failures(0),
          m_strand(boost::asio::make_strand(io_context)), m_timer(m_strand), m_workers(1), m_running(false)
    {
        if (!database.tableExists("vault_snapshots"))
        {
            try
            {
                SQLite::Statement statement(*m_database,
                                            "CREATE TABLE vault_snapshots (id INTEGER PRIMARY KEY, "
                                            "total_assets TEXT NOT NULL, total_shares TEXT NOT NULL, "
                                            "asset_decimals INTEGER NOT NULL, share_decimals INTEGER NOT NULL, "
                                            "share_price TEXT NOT NULL, captured_at INTEGER NOT NULL)");
                statement.exec();
            }
            catch (SQLite::Exception const& e)
            {
                m_logger->log(spdlog::level::critical, e.what());
                throw;
            }
        }

        this->load_last_persisted();
    }

    VaultLedger::~VaultLedger()
    {
        this->stop();
        m_workers.join();
    }

    auto VaultLedger::refresh(Clock::time_point const now) -> bool
    {
        try
        {
            this->apply(m_query(), now);
            return true;
        }
        catch (std::exception const& e)
        {
            this->on_failure(e.what());
            return false;
        }
    }

    auto VaultLedger::apply(LedgerReading const& reading, Clock::time_point const now) -> VaultSnapshot
    {
        VaultSnapshot const snapshot{.total_assets = reading.total_assets,
                                     .total_shares = reading.total_shares,
                                     .asset_decimals = reading.asset_decimals,
                                     .share_decimals = reading.share_decimals,
                                     .share_price = compute_share_price(reading),
                                     .captured_at = now};
        {
            std::lock_guard lock(m_mutex);
            m_history.push_back(snapshot);
            while (m_history.size() > std::max<size_t>(m_settings.history_size, 1))
            {
                m_history.pop_front();
            }
            m_consecutive_failures = 0;
        }

        if (this->should_persist(snapshot))
        {
            this->persist(snapshot);
        }

        m_logger->log(spdlog::level::debug, "Snapshot: assets: {}, shares: {}, price: {}", snapshot.total_assets.str(),
                      snapshot.total_shares.str(), format_fixed(snapshot.share_price, kSharePriceDecimals));
        return snapshot;
    }

    auto VaultLedger::latest_snapshot(Clock::time_point const now) const -> std::optional<VaultSnapshot>
    {
        std::lock_guard lock(m_mutex);
        if (m_history.empty())
        {
            return std::nullopt;
        }

        auto snapshot = m_history.back();
        snapshot.is_stale = now - snapshot.captured_at > m_settings.stale_after;
        return snapshot;
    }

    auto VaultLedger::history() const -> std::vector<VaultSnapshot>
    {
        std::lock_guard lock(m_mutex);
        return std::vector<VaultSnapshot>(m_history.begin(), m_history.end());
    }

    auto VaultLedger::consecutive_failures() const -> uint32_t
    {
        std::lock_guard lock(m_mutex);
        return m_consecutive_failures;
    }

    auto VaultLedger::start() -> void
    {
        boost::asio::post(m_strand, [this]() {
            if (m_running.exchange(true))
            {
                return;
            }
            m_logger->log(spdlog::level::info, "Vault indexer started (every {} ms)",
                          m_settings.refresh_interval.count());
            this->tick();
        });
    }

    auto VaultLedger::stop() -> void
    {
        if (m_running.exchange(false))
        {
            m_timer.cancel();
            m_logger->log(spdlog::level::info, "Vault indexer stopped");
        }
    }

    auto VaultLedger::tick() -> void
    {
        if (!m_running)
        {
            return;
        }

        // The custody query blocks, so it runs off the io thread and reports back through the strand.
        boost::asio::post(m_workers, [this]() {
            try
            {
                auto reading = m_query();
                boost::asio::post(m_strand, [this, reading = std::move(reading)]() {
                    try
                    {
                        this->apply(reading, Clock::now());
                    }
                    catch (std::exception const& e)
                    {
                        this->on_failure(e.what());
                    }
                    this->schedule();
                });
            }
            catch (std::exception const& e)
            {
                boost::asio::post(m_strand, [this, reason = std::string(e.what())]() {
                    this->on_failure(reason);
                    this->schedule();
                });
            }
        });
    }

    auto VaultLedger::schedule() -> void
    {
        if (!m_running)
        {
            return;
        }

        m_timer.expires_after(m_settings.refresh_interval);
        m_timer.async_wait(boost::asio::bind_executor(m_strand, [this](boost::system::error_code const& error) {
            if (!error)
            {
                this->tick();
            }
        }));
    }

    auto VaultLedger::on_failure(std::string_view const reason) -> void
    {
        std::lock_guard lock(m_mutex);
        ++m_consecutive_failures;
        if (m_history.empty())
        {
            m_logger->log(spdlog::level::warn, "Ledger refresh failed ({} in a row), no snapshot yet: {}",
                          m_consecutive_failures, reason);
        }
        else
        {
            m_logger->log(spdlog::level::warn, "Ledger refresh failed ({} in a row), keeping last snapshot: {}",
                          m_consecutive_failures, reason);
        }
    }

    auto VaultLedger::should_persist(VaultSnapshot const& snapshot) const -> bool
    {
        if (!m_last_persisted)
        {
            return true;
        }

        auto const& last = m_last_persisted.value();
        if (snapshot.total_assets != last.total_assets ||
            snapshot.captured_at - last.captured_at > m_settings.persist_interval)
        {
            return true;
        }

        // More than 0.01% price movement
        Amount const diff = snapshot.share_price > last.share_price ? snapshot.share_price - last.share_price
                                                                    : last.share_price - snapshot.share_price;
        return diff * 10000 > last.share_price;
    }

    auto VaultLedger::persist(VaultSnapshot const& snapshot) -> void
    {
        try
        {
            SQLite::Statement statement(*m_database,
                                        "INSERT INTO vault_snapshots (total_assets, total_shares, asset_decimals, "
                                        "share_decimals, share_price, captured_at) VALUES (?, ?, ?, ?, ?, ?)");
            statement.bind(1, snapshot.total_assets.str());
            statement.bind(2, snapshot.total_shares.str());
            statement.bind(3, snapshot.asset_decimals);
            statement.bind(4, snapshot.share_decimals);
            statement.bind(5, snapshot.share_price.str());
            statement.bind(6, to_millis(snapshot.captured_at));
            statement.exec();

            m_last_persisted = snapshot;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
        }
    }

    auto VaultLedger::load_last_persisted() -> void
    {
        try
        {
            SQLite::Statement statement(*m_database,
                                        "SELECT total_assets, total_shares, asset_decimals, share_decimals, "
                                        "share_price, captured_at FROM vault_snapshots ORDER BY captured_at DESC, "
                                        "id DESC LIMIT 1");
            if (!statement.executeStep())
            {
                return;
            }

            VaultSnapshot const snapshot{.total_assets = Amount(statement.getColumn(0).getString().c_str()),
                                         .total_shares = Amount(statement.getColumn(1).getString().c_str()),
                                         .asset_decimals = statement.getColumn(2).getUInt(),
                                         .share_decimals = statement.getColumn(3).getUInt(),
                                         .share_price = Amount(statement.getColumn(4).getString().c_str()),
                                         .captured_at = from_millis(statement.getColumn(5).getInt64())};

            std::lock_guard lock(m_mutex);
            m_history.push_back(snapshot);
            m_last_persisted = snapshot;
        }
        catch (SQLite::Exception const& e)
        {
            m_logger->log(spdlog::level::err, e.what());
        }
    }
} // namespace house::modules
