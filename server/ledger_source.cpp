#include "ledger_source.hpp"
#include "precompiled.hpp"
#include <fstream>
#include <limits>
#include <stdexcept>

namespace house
{
    namespace
    {
        // Digits of 2^256 - 1
        constexpr size_t kMaxAmountDigits = 78;

        auto read_amount(nlohmann::json const& document, char const* const key) -> modules::Amount
        {
            auto const& value = document.at(key);
            if (value.is_number_unsigned())
            {
                return modules::Amount(value.get<uint64_t>());
            }

            auto const digits = value.get<std::string>();
            if (digits.empty() || digits.size() > kMaxAmountDigits ||
                !std::ranges::all_of(digits, [](char const c) { return c >= '0' && c <= '9'; }))
            {
                throw std::runtime_error(std::format("{} is not an unsigned decimal amount", key));
            }

            boost::multiprecision::cpp_int const amount(digits.c_str());
            if (amount > static_cast<boost::multiprecision::cpp_int>(std::numeric_limits<modules::Amount>::max()))
            {
                throw std::runtime_error(std::format("{} does not fit 256 bits", key));
            }
            return static_cast<modules::Amount>(amount);
        }
    } // namespace

    auto parse_ledger_reading(nlohmann::json const& document) -> modules::LedgerReading
    {
        try
        {
            return modules::LedgerReading{.total_assets = read_amount(document, "totalAssets"),
                                          .total_shares = read_amount(document, "totalShares"),
                                          .asset_decimals = document.at("assetDecimals").get<uint32_t>(),
                                          .share_decimals = document.at("shareDecimals").get<uint32_t>()};
        }
        catch (nlohmann::json::exception const& e)
        {
            throw std::runtime_error(std::format("malformed ledger export: {}", e.what()));
        }
    }

    auto file_ledger_query(std::filesystem::path const& path) -> modules::LedgerQuery
    {
        return [path]() -> modules::LedgerReading {
            std::ifstream stream(path);
            if (!stream)
            {
                throw std::runtime_error(std::format("cannot open ledger export {}", path.string()));
            }

            try
            {
                return parse_ledger_reading(nlohmann::json::parse(stream));
            }
            catch (nlohmann::json::parse_error const& e)
            {
                throw std::runtime_error(std::format("malformed ledger export: {}", e.what()));
            }
        };
    }
} // namespace house
