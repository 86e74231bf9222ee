#pragma once

#include "core/fairness.hpp"
#include "modules/game_session.hpp"
#include "modules/rounds.hpp"
#include "modules/wallet.hpp"
#include <SQLiteCpp/SQLiteCpp.h>
#include <stdexcept>

namespace house::fixtures
{
    inline auto memory_database() -> SQLite::Database
    {
        return SQLite::Database(":memory:", SQLite::OPEN_READWRITE | SQLite::OPEN_CREATE);
    }

    // Opens and durably records a round, returning the player nonce that opens the commitment.
    inline auto open_round(modules::GameSession& game, modules::Wallet& wallet, modules::Rounds& rounds,
                           uint64_t const wager, modules::Clock::time_point const now) -> std::string
    {
        auto nonce = core::generate_nonce();
        auto const commitment = core::create_commitment(wager, core::CoinChoice::Heads, nonce);
        if (game.submit_commitment(static_cast<int64_t>(wager), "heads", commitment, now) != core::ErrorCode::Success)
        {
            throw std::runtime_error("commitment refused");
        }

        auto const& round = game.last_round().value();
        if (!wallet.reserve(round.player_id, wager, round.round_id) || !rounds.record_commitment(round) ||
            !game.acknowledge_commitment())
        {
            throw std::runtime_error("commitment not recorded");
        }
        return nonce;
    }

    // Plays rounds until one resolves with the wanted result. The winning round is not recorded; discarded rounds
    // are recorded as expired and their reservations released.
    inline auto play_until(modules::GameSession& game, modules::Wallet& wallet, modules::Rounds& rounds,
                           uint64_t const wager, bool const won, modules::Clock::time_point const now)
        -> modules::ResolvedRound
    {
        for (int attempt = 0; attempt < 256; ++attempt)
        {
            auto const nonce = open_round(game, wallet, rounds, wager, now);
            auto const result = game.reveal(nonce, now);
            if (!result.resolved)
            {
                throw std::runtime_error("reveal refused");
            }

            auto const& round = result.resolved->round();
            if (round.won == won)
            {
                return result.resolved.value();
            }

            auto discarded = round;
            discarded.state = modules::RoundState::Expired;
            if (!rounds.close(discarded, wallet))
            {
                throw std::runtime_error("discarded round not released");
            }
        }
        throw std::runtime_error("no round with the wanted result");
    }
} // namespace house::fixtures
