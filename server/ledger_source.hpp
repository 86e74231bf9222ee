#pragma once

#include "modules/vault.hpp"
#include <filesystem>

namespace house
{
    // Custody export read from a JSON document:
    // {"totalAssets": "...", "totalShares": "...", "assetDecimals": 6, "shareDecimals": 9}
    // Amounts are decimal strings or unsigned integers. Throws on a missing or malformed document.
    auto parse_ledger_reading(nlohmann::json const& document) -> modules::LedgerReading;

    // A ledger query that re-reads the export file on every call.
    auto file_ledger_query(std::filesystem::path const& path) -> modules::LedgerQuery;
} // namespace house
