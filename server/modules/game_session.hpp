#pragma once

#include "core/common.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace house::modules
{
    using Clock = std::chrono::system_clock;

    // Storage representation of time points
    auto to_millis(Clock::time_point const time_point) -> int64_t;

    auto from_millis(int64_t const millis) -> Clock::time_point;

    enum class RoundState : uint8_t
    {
        AwaitingCommitment,
        AwaitingReveal,
        Resolved,
        Settled,
        Voided,
        Expired
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(RoundState, {{RoundState::AwaitingCommitment, "AwaitingCommitment"},
                                              {RoundState::AwaitingReveal, "AwaitingReveal"},
                                              {RoundState::Resolved, "Resolved"},
                                              {RoundState::Settled, "Settled"},
                                              {RoundState::Voided, "Voided"},
                                              {RoundState::Expired, "Expired"}})

    struct Round
    {
        std::string round_id;
        std::string player_id;
        uint64_t wager;
        core::CoinChoice choice;
        std::string commitment;
        std::string house_nonce;
        std::string house_commitment;
        uint32_t house_edge_bps = core::kDefaultHouseEdgeBps;
        std::optional<std::string> player_nonce;
        std::optional<core::CoinChoice> outcome;
        bool won = false;
        uint64_t payout = 0;
        RoundState state = RoundState::AwaitingReveal;
        Clock::time_point committed_at;
        Clock::time_point last_activity;
        std::optional<Clock::time_point> revealed_at;
        std::optional<Clock::time_point> settled_at;
    };

    // A round that passed commitment verification. Only GameSession::reveal can produce one.
    class ResolvedRound
    {
        friend class GameSession;

      public:
        auto round() const -> Round const&;

        auto round_id() const -> std::string const&;

        auto player_id() const -> std::string const&;

        auto wager() const -> uint64_t;

        auto payout() const -> uint64_t;

        auto house_edge_bps() const -> uint32_t;

      private:
        ResolvedRound(Round round);

        Round m_round;
    };

    struct RevealResult
    {
        core::ErrorCode error_code;
        std::optional<ResolvedRound> resolved;
    };

    // Commit-reveal state machine for one player connection. At most one round is open at a time;
    // the most recent round stays readable through last_round() after it reaches a terminal state.
    class GameSession
    {
      public:
        GameSession(std::string_view const player_id, uint32_t const house_edge_bps);

        auto state() const -> RoundState;

        auto last_round() const -> std::optional<Round> const&;

        auto player_id() const -> std::string const&;

        // AwaitingCommitment -> AwaitingReveal. The house nonce is drawn here, after the commitment is accepted.
        auto submit_commitment(int64_t const wager, std::string_view const choice, std::string_view const commitment,
                               Clock::time_point const now) -> core::ErrorCode;

        // Marks the open round's commitment as durably recorded; reveal is refused until then.
        auto acknowledge_commitment() -> bool;

        // AwaitingReveal -> Resolved, or -> Voided when the nonce does not open the commitment.
        auto reveal(std::string_view const nonce, Clock::time_point const now) -> RevealResult;

        auto mark_settled(std::string_view const round_id, Clock::time_point const now) -> bool;

        // Open round -> Expired. Returns the expired round so its reservation can be released.
        auto expire(Clock::time_point const now) -> std::optional<Round>;

        auto expire_if_idle(Clock::time_point const now, std::chrono::milliseconds const window)
            -> std::optional<Round>;

      private:
        std::string m_player_id;
        uint32_t m_house_edge_bps;
        std::optional<Round> m_round;
        bool m_commit_acknowledged;
    };
} // namespace house::modules
