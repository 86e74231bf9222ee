#pragma once

#include "core/common.hpp"
#include <argh.h>
#include <chrono>
#include <filesystem>
#include <optional>

namespace house
{
    struct Settings
    {
        uint32_t port = 5555;
        std::filesystem::path log_path = "server.log";
        std::filesystem::path database_path = "house.db";
        std::optional<std::filesystem::path> ledger_path;

        uint32_t house_edge_bps = core::kDefaultHouseEdgeBps;
        uint64_t max_wager_divisor = 100;
        std::chrono::milliseconds round_timeout{std::chrono::seconds(120)};

        std::chrono::milliseconds heartbeat_interval{std::chrono::seconds(15)};
        std::chrono::milliseconds heartbeat_timeout{std::chrono::seconds(10)};

        std::chrono::milliseconds ledger_interval{std::chrono::seconds(15)};
        std::chrono::milliseconds stale_after{std::chrono::seconds(60)};
        size_t history_size = 64;

        std::chrono::milliseconds settle_interval{std::chrono::seconds(5)};
        uint32_t max_attempts = 5;
        std::chrono::milliseconds retry_base{std::chrono::seconds(2)};
        std::chrono::milliseconds retry_cap{std::chrono::seconds(300)};
        std::optional<uint64_t> pool_seed;

        bool trace = false;
    };

    // Reads the server options. Throws std::invalid_argument on malformed or out-of-range values.
    auto parse_settings(argh::parser const& command_line) -> Settings;
} // namespace house
