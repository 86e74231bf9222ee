#include "game_session.hpp"
#include "core/fairness.hpp"
#include "precompiled.hpp"
#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace house::modules
{
    auto to_millis(Clock::time_point const time_point) -> int64_t
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(time_point.time_since_epoch()).count();
    }

    auto from_millis(int64_t const millis) -> Clock::time_point
    {
        return Clock::time_point(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
    }

    ResolvedRound::ResolvedRound(Round round) : m_round(std::move(round))
    {
    }

    auto ResolvedRound::round() const -> Round const&
    {
        return m_round;
    }

    auto ResolvedRound::round_id() const -> std::string const&
    {
        return m_round.round_id;
    }

    auto ResolvedRound::player_id() const -> std::string const&
    {
        return m_round.player_id;
    }

    auto ResolvedRound::wager() const -> uint64_t
    {
        return m_round.wager;
    }

    auto ResolvedRound::payout() const -> uint64_t
    {
        return m_round.payout;
    }

    auto ResolvedRound::house_edge_bps() const -> uint32_t
    {
        return m_round.house_edge_bps;
    }

    GameSession::GameSession(std::string_view const player_id, uint32_t const house_edge_bps)
        : m_player_id(player_id), m_house_edge_bps(house_edge_bps), m_commit_acknowledged(false)
    {
    }

    auto GameSession::state() const -> RoundState
    {
        if (m_round && m_round->state == RoundState::AwaitingReveal)
        {
            return RoundState::AwaitingReveal;
        }
        return RoundState::AwaitingCommitment;
    }

    auto GameSession::last_round() const -> std::optional<Round> const&
    {
        return m_round;
    }

    auto GameSession::player_id() const -> std::string const&
    {
        return m_player_id;
    }

    auto GameSession::submit_commitment(int64_t const wager, std::string_view const choice,
                                        std::string_view const commitment, Clock::time_point const now)
        -> core::ErrorCode
    {
        if (this->state() != RoundState::AwaitingCommitment)
        {
            return core::ErrorCode::RoundConflict;
        }

        auto const parsed_choice = core::parse_choice(choice);
        if (wager <= 0 || !parsed_choice || !core::is_hex32(commitment))
        {
            return core::ErrorCode::ValidationError;
        }

        boost::uuids::random_generator generator;
        auto const house_nonce = core::generate_nonce();

        m_round = Round{.round_id = boost::uuids::to_string(generator()),
                        .player_id = m_player_id,
                        .wager = static_cast<uint64_t>(wager),
                        .choice = parsed_choice.value(),
                        .commitment = boost::algorithm::to_lower_copy(std::string(commitment)),
                        .house_nonce = house_nonce,
                        .house_commitment = core::house_commitment(house_nonce),
                        .house_edge_bps = m_house_edge_bps,
                        .state = RoundState::AwaitingReveal,
                        .committed_at = now,
                        .last_activity = now};
        m_commit_acknowledged = false;
        return core::ErrorCode::Success;
    }

    auto GameSession::acknowledge_commitment() -> bool
    {
        if (this->state() != RoundState::AwaitingReveal)
        {
            return false;
        }
        m_commit_acknowledged = true;
        return true;
    }

    auto GameSession::reveal(std::string_view const nonce, Clock::time_point const now) -> RevealResult
    {
        if (this->state() != RoundState::AwaitingReveal)
        {
            return {core::ErrorCode::NotFound, std::nullopt};
        }

        if (!m_commit_acknowledged)
        {
            return {core::ErrorCode::TransientInfrastructureError, std::nullopt};
        }

        if (!core::is_hex32(nonce))
        {
            return {core::ErrorCode::ValidationError, std::nullopt};
        }

        auto& round = m_round.value();
        round.last_activity = now;
        round.revealed_at = now;
        round.player_nonce = std::string(nonce);

        if (!core::verify_commitment(round.commitment, round.wager, round.choice, nonce))
        {
            round.state = RoundState::Voided;
            return {core::ErrorCode::FairnessViolation, std::nullopt};
        }

        auto const outcome = core::derive_result(nonce, round.house_nonce);
        round.outcome = outcome;
        round.won = outcome == round.choice;
        round.payout = core::calculate_payout(round.wager, round.won, round.house_edge_bps);
        round.state = RoundState::Resolved;

        return {core::ErrorCode::Success, ResolvedRound(round)};
    }

    auto GameSession::mark_settled(std::string_view const round_id, Clock::time_point const now) -> bool
    {
        if (!m_round || m_round->round_id != round_id || m_round->state != RoundState::Resolved)
        {
            return false;
        }

        m_round->state = RoundState::Settled;
        m_round->settled_at = now;
        return true;
    }

    auto GameSession::expire(Clock::time_point const now) -> std::optional<Round>
    {
        if (this->state() != RoundState::AwaitingReveal)
        {
            return std::nullopt;
        }

        m_round->state = RoundState::Expired;
        m_round->last_activity = now;
        return m_round;
    }

    auto GameSession::expire_if_idle(Clock::time_point const now, std::chrono::milliseconds const window)
        -> std::optional<Round>
    {
        if (this->state() != RoundState::AwaitingReveal || now - m_round->last_activity <= window)
        {
            return std::nullopt;
        }
        return this->expire(now);
    }
} // namespace house::modules
