#include "core/fairness.hpp"
#include "precompiled.hpp"
#include <gtest/gtest.h>
#include <set>

using namespace house;

namespace
{
    std::string const kPlayerNonce = "0x" + std::string(64, '1');
    std::string const kHouseNonce = "0x" + std::string(64, '2');
} // namespace

TEST(Fairness, GenerateNonce_Test)
{
    std::set<std::string> nonces;
    for (uint32_t const i : std::views::iota(0u, 100u))
    {
        auto const nonce = core::generate_nonce();
        ASSERT_EQ(nonce.size(), core::kNonceLength);
        ASSERT_EQ(nonce.substr(0, 2), "0x");
        ASSERT_TRUE(core::is_hex32(nonce));
        ASSERT_EQ(nonce, boost::algorithm::to_lower_copy(nonce));
        nonces.insert(nonce);
    }
    ASSERT_EQ(nonces.size(), 100u);
}

TEST(Fairness, CommitmentKnownAnswer_Test)
{
    ASSERT_EQ(core::create_commitment(1000000, core::CoinChoice::Heads, kPlayerNonce),
              "0x2348420ca5560b35f7f082c1209626f25b45b74524bf9d96d7ed16a618978baf");
    ASSERT_EQ(core::house_commitment(kHouseNonce),
              "0xc4bd59e1394781d1c7bf20a2c0b30c2acc9fbdd52dc5e0d76917de4034ebdf59");
    ASSERT_EQ(core::derive_result(kPlayerNonce, kHouseNonce), core::CoinChoice::Tails);
}

TEST(Fairness, VerifyCommitment_Test)
{
    for (uint32_t const i : std::views::iota(0u, 20u))
    {
        auto const nonce = core::generate_nonce();
        uint64_t const wager = 1 + i * 1000;
        auto const choice = i % 2 == 0 ? core::CoinChoice::Heads : core::CoinChoice::Tails;
        auto const other_choice = choice == core::CoinChoice::Heads ? core::CoinChoice::Tails : core::CoinChoice::Heads;
        auto const commitment = core::create_commitment(wager, choice, nonce);

        ASSERT_TRUE(core::verify_commitment(commitment, wager, choice, nonce));
        ASSERT_FALSE(core::verify_commitment(commitment, wager + 1, choice, nonce));
        ASSERT_FALSE(core::verify_commitment(commitment, wager, other_choice, nonce));
        ASSERT_FALSE(core::verify_commitment(commitment, wager, choice, core::generate_nonce()));
    }

    // Upper case hex is the same commitment
    auto const commitment = core::create_commitment(42, core::CoinChoice::Tails, kPlayerNonce);
    ASSERT_TRUE(core::verify_commitment(boost::algorithm::to_upper_copy(commitment.substr(2)).insert(0, "0x"), 42,
                                        core::CoinChoice::Tails, kPlayerNonce));
}

TEST(Fairness, MalformedInput_Test)
{
    ASSERT_THROW(core::create_commitment(1, core::CoinChoice::Heads, "0x1234"), std::invalid_argument);
    ASSERT_THROW(core::create_commitment(1, core::CoinChoice::Heads, std::string(66, 'z')), std::invalid_argument);
    ASSERT_THROW(core::derive_result("nonce", kHouseNonce), std::invalid_argument);

    auto const commitment = core::create_commitment(1, core::CoinChoice::Heads, kPlayerNonce);
    ASSERT_FALSE(core::verify_commitment("0x", 1, core::CoinChoice::Heads, kPlayerNonce));
    ASSERT_FALSE(core::verify_commitment(commitment, 1, core::CoinChoice::Heads, "not a nonce"));
    ASSERT_FALSE(core::verify_commitment(commitment.substr(2), 1, core::CoinChoice::Heads, kPlayerNonce));

    ASSERT_FALSE(core::is_hex32(""));
    ASSERT_FALSE(core::is_hex32("0x" + std::string(63, 'a')));
    ASSERT_FALSE(core::is_hex32("0x" + std::string(63, 'a') + "g"));
    ASSERT_TRUE(core::is_hex32("0x" + std::string(64, 'F')));
}

TEST(Fairness, HouseCommitment_Test)
{
    auto const house_nonce = core::generate_nonce();
    auto const commitment = core::house_commitment(house_nonce);

    ASSERT_TRUE(core::verify_house_commitment(commitment, house_nonce));
    ASSERT_FALSE(core::verify_house_commitment(commitment, core::generate_nonce()));
    ASSERT_FALSE(core::verify_house_commitment("0x00", house_nonce));
}

TEST(Fairness, DeriveResultDeterministic_Test)
{
    for (uint32_t const i : std::views::iota(0u, 100u))
    {
        auto const player_nonce = core::generate_nonce();
        auto const house_nonce = core::generate_nonce();
        ASSERT_EQ(core::derive_result(player_nonce, house_nonce), core::derive_result(player_nonce, house_nonce));
    }
}

TEST(Fairness, DeriveResultDistribution_Test)
{
    uint32_t heads = 0;
    uint32_t const samples = 10000;
    for (uint32_t const i : std::views::iota(0u, samples))
    {
        if (core::derive_result(core::generate_nonce(), core::generate_nonce()) == core::CoinChoice::Heads)
        {
            ++heads;
        }
    }

    ASSERT_GE(heads, samples * 45 / 100);
    ASSERT_LE(heads, samples * 55 / 100);
}

TEST(Fairness, CalculatePayout_Test)
{
    for (uint64_t const wager : {1ull, 7ull, 1000ull, 1000000ull, 123456789ull})
    {
        ASSERT_EQ(core::calculate_payout(wager, false), 0u);
        ASSERT_EQ(core::calculate_payout(wager, true), wager * 2 * 9800 / 10000);
        ASSERT_EQ(core::calculate_payout(wager, true), core::calculate_payout(wager, true));
    }

    ASSERT_EQ(core::calculate_payout(1000000, true), 1960000u);
    ASSERT_EQ(core::calculate_payout(1000000, true, 0), 2000000u);
    ASSERT_EQ(core::calculate_payout(1000000, true, 500), 1900000u);
    ASSERT_EQ(core::calculate_payout(1000000, true, 10000), 0u);
    ASSERT_EQ(core::calculate_payout(3, true), 5u);

    // No 64-bit overflow in the intermediate product
    uint64_t const large_wager = 4000000000000000000ull;
    ASSERT_EQ(core::calculate_payout(large_wager, true), 7840000000000000000ull);

    ASSERT_THROW(core::calculate_payout(1, true, 10001), std::invalid_argument);
}

TEST(Fairness, ParseChoice_Test)
{
    ASSERT_EQ(core::parse_choice("heads").value(), core::CoinChoice::Heads);
    ASSERT_EQ(core::parse_choice("tails").value(), core::CoinChoice::Tails);
    ASSERT_FALSE(core::parse_choice("edge"));
    ASSERT_FALSE(core::parse_choice("Heads"));
    ASSERT_EQ(core::to_string(core::CoinChoice::Tails), "tails");
}
