#include "settings.hpp"
#include "precompiled.hpp"
#include <stdexcept>

namespace house
{
    namespace
    {
        template <typename T>
        auto read_option(argh::parser const& command_line, std::initializer_list<char const* const> names,
                         T& value) -> void
        {
            auto stream = command_line(names);
            if (stream.str().empty())
            {
                return;
            }

            T parsed;
            if (!(stream >> parsed) || !stream.eof())
            {
                throw std::invalid_argument(std::format("invalid value for {}", *names.begin()));
            }
            value = parsed;
        }

        auto read_seconds(argh::parser const& command_line, std::initializer_list<char const* const> names,
                          std::chrono::milliseconds& value) -> void
        {
            uint64_t seconds = std::chrono::duration_cast<std::chrono::seconds>(value).count();
            read_option(command_line, names, seconds);
            if (seconds == 0)
            {
                throw std::invalid_argument(std::format("{} must be positive", *names.begin()));
            }
            value = std::chrono::seconds(seconds);
        }
    } // namespace

    auto parse_settings(argh::parser const& command_line) -> Settings
    {
        Settings settings;

        read_option(command_line, {"-p", "--port"}, settings.port);
        if (settings.port == 0 || settings.port > 65535)
        {
            throw std::invalid_argument("--port must be within 1..65535");
        }

        std::string path;
        if (command_line({"-l", "--log"}) >> path)
        {
            settings.log_path = path;
        }
        if (command_line({"-d", "--database"}) >> path)
        {
            settings.database_path = path;
        }
        if (command_line({"--ledger"}) >> path)
        {
            settings.ledger_path = path;
        }

        read_option(command_line, {"--house-edge-bps"}, settings.house_edge_bps);
        if (settings.house_edge_bps > core::kBpsBase)
        {
            throw std::invalid_argument("--house-edge-bps must not exceed 10000");
        }

        read_option(command_line, {"--max-wager-divisor"}, settings.max_wager_divisor);
        if (settings.max_wager_divisor == 0)
        {
            throw std::invalid_argument("--max-wager-divisor must be positive");
        }

        read_seconds(command_line, {"--round-timeout"}, settings.round_timeout);
        read_seconds(command_line, {"--heartbeat-interval"}, settings.heartbeat_interval);
        read_seconds(command_line, {"--heartbeat-timeout"}, settings.heartbeat_timeout);
        read_seconds(command_line, {"--ledger-interval"}, settings.ledger_interval);
        read_seconds(command_line, {"--stale-after"}, settings.stale_after);
        read_seconds(command_line, {"--settle-interval"}, settings.settle_interval);
        read_seconds(command_line, {"--retry-base"}, settings.retry_base);
        read_seconds(command_line, {"--retry-cap"}, settings.retry_cap);
        if (settings.retry_cap < settings.retry_base)
        {
            throw std::invalid_argument("--retry-cap must not be shorter than --retry-base");
        }

        read_option(command_line, {"--max-attempts"}, settings.max_attempts);
        if (settings.max_attempts == 0)
        {
            throw std::invalid_argument("--max-attempts must be positive");
        }

        read_option(command_line, {"--history"}, settings.history_size);
        if (settings.history_size == 0)
        {
            throw std::invalid_argument("--history must be positive");
        }

        uint64_t pool_seed = 0;
        read_option(command_line, {"--pool-seed"}, pool_seed);
        if (pool_seed > 0)
        {
            settings.pool_seed = pool_seed;
        }

        settings.trace = command_line[{"-t", "--trace"}];
        return settings;
    }
} // namespace house
