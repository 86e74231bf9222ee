#include "gateway.hpp"
#include "core/fairness.hpp"
#include "core/logging.hpp"
#include "precompiled.hpp"

namespace house
{
    namespace
    {
        constexpr size_t kMaxPlayerIdLength = 64;
    } // namespace

    Gateway::Gateway(modules::Wallet& wallet, modules::Rounds& rounds, modules::SettlementPipeline& pipeline,
                     modules::VaultLedger const* vault, PlayerRegistry& registry, GatewaySettings const& settings,
                     std::optional<std::filesystem::path> const log_path)
        : m_wallet(&wallet), m_rounds(&rounds), m_pipeline(&pipeline), m_vault(vault), m_registry(&registry),
          m_settings(settings), m_logger(core::create_logger("gateway", log_path))
    {
    }

    auto Gateway::on_message(PlayerContext& context, std::string_view const line, modules::Clock::time_point const now)
        -> Response
    {
        try
        {
            auto const packet = nlohmann::json::parse(line);
            auto const message_type = packet.at("type").get<core::MessageType>();
            auto const payload = packet.value("payload", nlohmann::json::object());

            m_logger->log(spdlog::level::trace, "Packet (msg: {}) from session {}", packet.at("type").dump(),
                          context.session_id);

            if (message_type == core::MessageType::Hello)
            {
                return this->hello(context, payload);
            }

            if (message_type != core::MessageType::Unknown && !context.game)
            {
                return error(core::ErrorCode::NotIdentified, "identify with hello first");
            }

            switch (message_type)
            {
                case core::MessageType::Ping: {
                    return Response(core::MessageType::Pong, std::nullopt);
                }

                case core::MessageType::Deposit: {
                    return this->deposit(context.game.value(), payload);
                }

                case core::MessageType::Balance: {
                    return this->balance(context.game.value());
                }

                case core::MessageType::SubmitCommitment: {
                    return this->submit_commitment(context, payload, now);
                }

                case core::MessageType::Reveal: {
                    return this->reveal(context, payload, now);
                }

                case core::MessageType::SettlementStatus: {
                    return this->settlement_status(context.game.value(), payload);
                }

                case core::MessageType::Vault: {
                    return this->vault(now);
                }

                default: {
                    return error(core::ErrorCode::UnknownMessage, "unknown message type");
                }
            }
        }
        catch (nlohmann::json::exception const& e)
        {
            m_logger->log(spdlog::level::debug, "Malformed packet from session {}: {}", context.session_id, e.what());
            return error(core::ErrorCode::ValidationError, "malformed message");
        }
    }

    auto Gateway::on_tick(PlayerContext& context, modules::Clock::time_point const now) -> std::vector<Response>
    {
        std::vector<Response> responses;
        if (!context.game)
        {
            return responses;
        }

        auto& game = context.game.value();
        if (context.pending_handoff)
        {
            auto const pending = context.pending_handoff.value();
            if (this->hand_off(context, pending, now))
            {
                responses.emplace_back(resolved(pending.round()));
            }
        }

        if (auto const expired = game.expire_if_idle(now, m_settings.round_timeout))
        {
            m_logger->log(spdlog::level::warn, "Round {} of player {} timed out awaiting reveal",
                          expired->round_id, expired->player_id);
            if (!this->release_round(expired.value()))
            {
                m_logger->log(spdlog::level::warn, "Round {} is left to start-up recovery", expired->round_id);
            }
            responses.emplace_back(core::MessageType::Expired, nlohmann::json{{"roundId", expired->round_id}});
        }

        auto const& last_round = game.last_round();
        if (last_round && last_round->state == modules::RoundState::Resolved &&
            m_pipeline->status(last_round->round_id) == modules::SettlementStatus::Settled)
        {
            auto const round_id = last_round->round_id;
            game.mark_settled(round_id, now);
            nlohmann::json payload{{"roundId", round_id}, {"status", modules::SettlementStatus::Settled}};
            responses.emplace_back(core::MessageType::Settlement, std::move(payload));
        }
        return responses;
    }

    auto Gateway::on_closed(PlayerContext& context, modules::Clock::time_point const now) -> void
    {
        if (!context.game)
        {
            return;
        }

        auto& game = context.game.value();
        if (context.pending_handoff)
        {
            auto const pending = context.pending_handoff.value();
            if (!this->hand_off(context, pending, now))
            {
                m_logger->log(spdlog::level::critical, "Round {} of player {} was never queued, expiring it",
                              pending.round_id(), pending.player_id());
                auto round = pending.round();
                round.state = modules::RoundState::Expired;
                round.last_activity = now;
                if (!this->release_round(round))
                {
                    m_logger->log(spdlog::level::warn, "Round {} is left to start-up recovery", round.round_id);
                }
                context.pending_handoff.reset();
            }
        }

        if (auto const expired = game.expire(now))
        {
            m_logger->log(spdlog::level::warn, "Round {} of player {} expired on disconnect", expired->round_id,
                          expired->player_id);
            if (!this->release_round(expired.value()))
            {
                m_logger->log(spdlog::level::warn, "Round {} is left to start-up recovery", expired->round_id);
            }
        }

        m_registry->remove(game.player_id(), context.session_id);
        m_logger->log(spdlog::level::debug, "Player {} left (session {})", game.player_id(), context.session_id);
        context.game.reset();
    }

    auto Gateway::hello(PlayerContext& context, nlohmann::json const& payload) -> Response
    {
        if (context.game)
        {
            return error(core::ErrorCode::ValidationError,
                         std::format("already identified as {}", context.game->player_id()));
        }

        auto const player_id = payload.at("playerId").get<std::string>();
        if (player_id.empty() || player_id.size() > kMaxPlayerIdLength)
        {
            return error(core::ErrorCode::ValidationError, "playerId must be 1 to 64 characters");
        }

        if (!m_registry->try_register(player_id, context.session_id))
        {
            return error(core::ErrorCode::IdentityInUse, "player is connected elsewhere");
        }

        context.game.emplace(player_id, m_settings.house_edge_bps);
        m_logger->log(spdlog::level::info, "Player {} joined (session {})", player_id, context.session_id);
        return Response(core::MessageType::Welcome, nlohmann::json{{"playerId", player_id}});
    }

    auto Gateway::deposit(modules::GameSession& game, nlohmann::json const& payload) -> Response
    {
        auto const& amount = payload.at("amount");
        if (!amount.is_number_integer() || amount.get<int64_t>() <= 0)
        {
            return error(core::ErrorCode::ValidationError, "amount must be a positive integer");
        }

        if (!m_wallet->deposit(game.player_id(), amount.get<uint64_t>()))
        {
            return error(core::ErrorCode::TransientInfrastructureError, "deposit could not be recorded");
        }
        return this->balance(game);
    }

    auto Gateway::balance(modules::GameSession& game) -> Response
    {
        auto const balance_info = m_wallet->balance(game.player_id());
        if (!balance_info)
        {
            return error(core::ErrorCode::TransientInfrastructureError, "balance is unavailable");
        }
        return Response(core::MessageType::Balance, nlohmann::json{{"available", balance_info->available},
                                                                   {"reserved", balance_info->reserved}});
    }

    auto Gateway::submit_commitment(PlayerContext& context, nlohmann::json const& payload,
                                    modules::Clock::time_point const now) -> Response
    {
        if (context.pending_handoff)
        {
            return error(core::ErrorCode::RoundConflict,
                         std::format("round {} is still being recorded", context.pending_handoff->round_id()));
        }

        auto& game = context.game.value();
        if (game.state() != modules::RoundState::AwaitingCommitment)
        {
            return error(core::ErrorCode::RoundConflict, "a round is already open");
        }

        auto const& wager = payload.at("wager");
        if (!wager.is_number_integer())
        {
            return error(core::ErrorCode::ValidationError, "wager must be an integer");
        }

        if (wager.get<int64_t>() > 0)
        {
            auto const pool_balance = m_pipeline->pool_balance();
            if (!pool_balance)
            {
                return error(core::ErrorCode::ValidationError, "house pool is not funded");
            }

            auto const limit = pool_balance.value() / m_settings.max_wager_divisor;
            if (static_cast<uint64_t>(wager.get<int64_t>()) > limit)
            {
                return error(core::ErrorCode::ValidationError,
                             std::format("wager exceeds the table limit of {}", limit));
            }
        }

        auto const error_code =
            game.submit_commitment(wager.get<int64_t>(), payload.at("choice").get<std::string>(),
                                   payload.at("commitment").get<std::string>(), now);
        if (error_code != core::ErrorCode::Success)
        {
            return error(error_code, "wager must be positive, choice heads or tails, commitment 0x + 64 hex digits");
        }

        auto const round = game.last_round().value();
        if (!m_wallet->reserve(round.player_id, round.wager, round.round_id))
        {
            game.expire(now);
            return error(core::ErrorCode::ValidationError, "insufficient balance");
        }

        if (!m_rounds->record_commitment(round))
        {
            game.expire(now);
            if (!m_wallet->release(round.player_id, round.wager, round.round_id))
            {
                m_logger->log(spdlog::level::critical, "Round {} was not recorded and its wager of {} stays reserved",
                              round.round_id, round.wager);
            }
            return error(core::ErrorCode::TransientInfrastructureError, "commitment could not be recorded");
        }
        game.acknowledge_commitment();

        m_logger->log(spdlog::level::debug, "Round {} opened: player: {}, wager: {}, choice: {}", round.round_id,
                      round.player_id, round.wager, core::to_string(round.choice));
        return Response(core::MessageType::Committed,
                        nlohmann::json{{"roundId", round.round_id}, {"houseCommitment", round.house_commitment}});
    }

    auto Gateway::reveal(PlayerContext& context, nlohmann::json const& payload, modules::Clock::time_point const now)
        -> Response
    {
        auto& game = context.game.value();
        auto const nonce = payload.at("nonce").get<std::string>();
        auto const result = game.reveal(nonce, now);

        switch (result.error_code)
        {
            case core::ErrorCode::Success:
                break;

            case core::ErrorCode::FairnessViolation: {
                auto const& round = game.last_round().value();
                if (!this->release_round(round))
                {
                    return error(core::ErrorCode::TransientInfrastructureError,
                                 std::format("round {} is void, its wager is returned on recovery", round.round_id));
                }
                return Response(core::MessageType::Voided,
                                nlohmann::json{{"roundId", round.round_id},
                                               {"reason", "revealed nonce does not open the commitment"}});
            }

            case core::ErrorCode::NotFound:
                return error(result.error_code, "no round is awaiting reveal");

            case core::ErrorCode::TransientInfrastructureError:
                return error(result.error_code, "commitment is not recorded yet");

            default:
                return error(result.error_code, "nonce must be 0x followed by 64 hex digits");
        }

        auto const& resolved_round = result.resolved.value();
        if (!this->hand_off(context, resolved_round, now))
        {
            return error(core::ErrorCode::TransientInfrastructureError,
                         std::format("round {} is not recorded yet, its result follows", resolved_round.round_id()));
        }
        return resolved(resolved_round.round());
    }

    auto Gateway::hand_off(PlayerContext& context, modules::ResolvedRound const& resolved_round,
                           modules::Clock::time_point const now) -> bool
    {
        auto const& round = resolved_round.round();
        if (!m_pipeline->enqueue(resolved_round, now))
        {
            if (!context.pending_handoff)
            {
                m_logger->log(spdlog::level::err, "Round {} resolved but not queued, retrying", round.round_id);
                context.pending_handoff = resolved_round;
            }
            return false;
        }

        context.pending_handoff.reset();
        m_logger->log(spdlog::level::info, "Round {} resolved: player: {}, outcome: {}, won: {}, payout: {}",
                      round.round_id, round.player_id, core::to_string(round.outcome.value()), round.won,
                      round.payout);
        return true;
    }

    auto Gateway::settlement_status(modules::GameSession& game, nlohmann::json const& payload) -> Response
    {
        auto const round_id = payload.at("roundId").get<std::string>();
        auto const settlement_info = m_pipeline->info(round_id);
        if (!settlement_info || settlement_info->player_id != game.player_id())
        {
            return error(core::ErrorCode::NotFound, "no settlement for this round");
        }

        return Response(core::MessageType::Settlement, nlohmann::json{{"roundId", round_id},
                                                                      {"status", settlement_info->status},
                                                                      {"attempts", settlement_info->attempts}});
    }

    auto Gateway::vault(modules::Clock::time_point const now) -> Response
    {
        if (!m_vault)
        {
            return error(core::ErrorCode::NotFound, "vault ledger is not configured");
        }

        auto const snapshot = m_vault->latest_snapshot(now);
        if (!snapshot)
        {
            return error(core::ErrorCode::NotFound, "no vault snapshot yet");
        }
        return Response(core::MessageType::Vault, nlohmann::json(snapshot.value()));
    }

    auto Gateway::release_round(modules::Round const& round) -> bool
    {
        if (!m_rounds->close(round, *m_wallet))
        {
            m_logger->log(spdlog::level::err, "Round {} is still open in storage, its wager of {} stays reserved",
                          round.round_id, round.wager);
            return false;
        }
        return true;
    }

    auto Gateway::resolved(modules::Round const& round) -> Response
    {
        return Response(core::MessageType::Resolved, nlohmann::json{{"roundId", round.round_id},
                                                                    {"outcome", round.outcome.value()},
                                                                    {"won", round.won},
                                                                    {"payout", round.payout},
                                                                    {"houseNonce", round.house_nonce}});
    }

    auto Gateway::error(core::ErrorCode const error_code, std::string_view const message) -> Response
    {
        return Response(core::MessageType::Error,
                        nlohmann::json{{"code", error_code}, {"message", std::string(message)}});
    }
} // namespace house
