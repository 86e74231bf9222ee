#include "precompiled.hpp"
#include "settings.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

using namespace house;

namespace
{
    auto parse(std::vector<char const*> arguments) -> Settings
    {
        arguments.insert(arguments.begin(), "house_server");
        argh::parser command_line(static_cast<int>(arguments.size()), arguments.data(),
                                  argh::parser::PREFER_PARAM_FOR_UNREG_OPTION);
        return parse_settings(command_line);
    }
} // namespace

TEST(Settings, Defaults_Test)
{
    auto const settings = parse({});

    ASSERT_EQ(settings.port, 5555u);
    ASSERT_EQ(settings.database_path.string(), "house.db");
    ASSERT_FALSE(settings.ledger_path);
    ASSERT_EQ(settings.house_edge_bps, 200u);
    ASSERT_EQ(settings.max_wager_divisor, 100u);
    ASSERT_TRUE(settings.round_timeout == std::chrono::seconds(120));
    ASSERT_EQ(settings.max_attempts, 5u);
    ASSERT_FALSE(settings.pool_seed);
    ASSERT_FALSE(settings.trace);
}

TEST(Settings, Options_Test)
{
    auto const settings = parse({"-p", "6000", "--database", "test.db", "--ledger", "vault.json",
                                 "--house-edge-bps", "150", "--round-timeout", "30", "--retry-base", "1",
                                 "--retry-cap", "60", "--pool-seed", "1000000000", "--trace"});

    ASSERT_EQ(settings.port, 6000u);
    ASSERT_EQ(settings.database_path.string(), "test.db");
    ASSERT_EQ(settings.ledger_path->string(), "vault.json");
    ASSERT_EQ(settings.house_edge_bps, 150u);
    ASSERT_TRUE(settings.round_timeout == std::chrono::seconds(30));
    ASSERT_TRUE(settings.retry_base == std::chrono::seconds(1));
    ASSERT_TRUE(settings.retry_cap == std::chrono::seconds(60));
    ASSERT_EQ(settings.pool_seed.value(), 1000000000u);
    ASSERT_TRUE(settings.trace);
}

TEST(Settings, RejectsBadValues_Test)
{
    ASSERT_THROW(parse({"-p", "0"}), std::invalid_argument);
    ASSERT_THROW(parse({"-p", "70000"}), std::invalid_argument);
    ASSERT_THROW(parse({"-p", "http"}), std::invalid_argument);
    ASSERT_THROW(parse({"--house-edge-bps", "10001"}), std::invalid_argument);
    ASSERT_THROW(parse({"--max-wager-divisor", "0"}), std::invalid_argument);
    ASSERT_THROW(parse({"--round-timeout", "0"}), std::invalid_argument);
    ASSERT_THROW(parse({"--retry-base", "10", "--retry-cap", "5"}), std::invalid_argument);
    ASSERT_THROW(parse({"--max-attempts", "0"}), std::invalid_argument);
}
