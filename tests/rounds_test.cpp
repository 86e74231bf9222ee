#include "helpers.hpp"
#include "modules/rounds.hpp"
#include "precompiled.hpp"
#include <gtest/gtest.h>

using namespace house;

namespace
{
    auto const kNow = modules::Clock::time_point(std::chrono::milliseconds(1700000000123));
} // namespace

TEST(Rounds, RecordCommitment_Test)
{
    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);
    modules::GameSession game("alice", 350);

    ASSERT_TRUE(wallet.deposit("alice", 1000));
    fixtures::open_round(game, wallet, rounds, 300, kNow);
    auto const& round = game.last_round().value();

    auto const stored = rounds.find(round.round_id);
    ASSERT_TRUE(stored);
    ASSERT_EQ(stored->player_id, "alice");
    ASSERT_EQ(stored->wager, 300u);
    ASSERT_EQ(stored->choice, core::CoinChoice::Heads);
    ASSERT_EQ(stored->commitment, round.commitment);
    ASSERT_EQ(stored->house_nonce, round.house_nonce);
    ASSERT_EQ(stored->house_commitment, round.house_commitment);
    ASSERT_EQ(stored->house_edge_bps, 350u);
    ASSERT_EQ(stored->state, modules::RoundState::AwaitingReveal);
    ASSERT_TRUE(stored->committed_at == kNow);
    ASSERT_FALSE(stored->player_nonce);
    ASSERT_FALSE(stored->outcome);

    // The round id is the key
    ASSERT_FALSE(rounds.record_commitment(round));
    ASSERT_FALSE(rounds.find("missing"));
}

TEST(Rounds, RecordOutcome_Test)
{
    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);
    modules::GameSession game("alice", core::kDefaultHouseEdgeBps);

    ASSERT_TRUE(wallet.deposit("alice", 1000));
    auto const nonce = fixtures::open_round(game, wallet, rounds, 300, kNow);
    auto const result = game.reveal(nonce, kNow + std::chrono::seconds(2));
    ASSERT_TRUE(result.resolved);
    ASSERT_TRUE(rounds.record_outcome(result.resolved->round()));

    auto const stored = rounds.find(result.resolved->round_id());
    ASSERT_EQ(stored->state, modules::RoundState::Resolved);
    ASSERT_EQ(stored->player_nonce.value(), nonce);
    ASSERT_EQ(stored->outcome.value(), result.resolved->round().outcome.value());
    ASSERT_EQ(stored->won, result.resolved->round().won);
    ASSERT_EQ(stored->payout, result.resolved->payout());
    ASSERT_TRUE(stored->revealed_at.value() == kNow + std::chrono::seconds(2));

    // The stored record alone proves the outcome
    ASSERT_TRUE(core::verify_commitment(stored->commitment, stored->wager, stored->choice, nonce));
    ASSERT_EQ(core::derive_result(nonce, stored->house_nonce), stored->outcome.value());
}

TEST(Rounds, MarkSettledRequiresResolved_Test)
{
    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);
    modules::GameSession game("alice", core::kDefaultHouseEdgeBps);

    ASSERT_TRUE(wallet.deposit("alice", 1000));
    auto const nonce = fixtures::open_round(game, wallet, rounds, 300, kNow);
    auto const round_id = game.last_round()->round_id;

    ASSERT_FALSE(rounds.mark_settled(round_id, kNow));

    auto const result = game.reveal(nonce, kNow);
    ASSERT_TRUE(rounds.record_outcome(result.resolved->round()));
    ASSERT_TRUE(rounds.mark_settled(round_id, kNow));
    ASSERT_FALSE(rounds.mark_settled(round_id, kNow));

    auto const stored = rounds.find(round_id);
    ASSERT_EQ(stored->state, modules::RoundState::Settled);
    ASSERT_TRUE(stored->settled_at);
}

TEST(Rounds, VoidedRoundIsAudited_Test)
{
    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);
    modules::GameSession game("alice", 350);

    ASSERT_TRUE(wallet.deposit("alice", 1000));
    fixtures::open_round(game, wallet, rounds, 300, kNow);

    auto const wrong_nonce = core::generate_nonce();
    ASSERT_EQ(game.reveal(wrong_nonce, kNow).error_code, core::ErrorCode::FairnessViolation);
    ASSERT_TRUE(rounds.record_outcome(game.last_round().value()));

    auto const stored = rounds.find(game.last_round()->round_id);
    ASSERT_EQ(stored->state, modules::RoundState::Voided);
    ASSERT_EQ(stored->player_nonce.value(), wrong_nonce);
    ASSERT_FALSE(stored->outcome);
    ASSERT_FALSE(rounds.mark_settled(stored->round_id, kNow));
}

TEST(Rounds, ExpireOrphans_Test)
{
    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);

    ASSERT_TRUE(wallet.deposit("alice", 1000));
    ASSERT_TRUE(wallet.deposit("bob", 1000));

    modules::GameSession alice("alice", core::kDefaultHouseEdgeBps);
    modules::GameSession bob("bob", core::kDefaultHouseEdgeBps);
    fixtures::open_round(alice, wallet, rounds, 100, kNow);
    auto const bob_nonce = fixtures::open_round(bob, wallet, rounds, 200, kNow);
    ASSERT_TRUE(rounds.record_outcome(bob.reveal(bob_nonce, kNow).resolved->round()));

    auto const orphans = rounds.expire_orphans(kNow + std::chrono::minutes(10));
    ASSERT_EQ(orphans.size(), 1u);
    ASSERT_EQ(orphans[0].player_id, "alice");
    ASSERT_EQ(orphans[0].wager, 100u);
    ASSERT_EQ(orphans[0].state, modules::RoundState::Expired);

    ASSERT_EQ(rounds.find(alice.last_round()->round_id)->state, modules::RoundState::Expired);
    ASSERT_EQ(rounds.find(bob.last_round()->round_id)->state, modules::RoundState::Resolved);
    ASSERT_TRUE(rounds.expire_orphans(kNow).empty());
}

TEST(Rounds, CloseReturnsWagerAtomically_Test)
{
    auto test_db = fixtures::memory_database();
    modules::Wallet wallet(test_db, std::nullopt);
    modules::Rounds rounds(test_db, std::nullopt);
    modules::GameSession game("alice", core::kDefaultHouseEdgeBps);

    ASSERT_TRUE(wallet.deposit("alice", 1000));
    fixtures::open_round(game, wallet, rounds, 300, kNow);
    auto const expired = game.expire(kNow + std::chrono::minutes(3)).value();

    // Without a reservation to return, the round stays open in storage
    test_db.exec("UPDATE balances SET reserved = 0");
    ASSERT_FALSE(rounds.close(expired, wallet));
    ASSERT_EQ(rounds.find(expired.round_id)->state, modules::RoundState::AwaitingReveal);

    test_db.exec("UPDATE balances SET reserved = 300");
    ASSERT_TRUE(rounds.close(expired, wallet));
    ASSERT_EQ(rounds.find(expired.round_id)->state, modules::RoundState::Expired);
    ASSERT_EQ(wallet.balance("alice")->available, 1000u);
    ASSERT_EQ(wallet.balance("alice")->reserved, 0u);

    ASSERT_FALSE(rounds.close(expired, wallet));
}
