#pragma once

#include "modules/rounds.hpp"
#include "modules/settlement.hpp"
#include "modules/vault.hpp"
#include "modules/wallet.hpp"
#include "registry.hpp"
#include "session.hpp"

namespace house
{
    struct GatewaySettings
    {
        uint32_t house_edge_bps = core::kDefaultHouseEdgeBps;
        // A wager may not exceed pool balance / max_wager_divisor.
        uint64_t max_wager_divisor = 100;
        std::chrono::milliseconds round_timeout{std::chrono::seconds(120)};
    };

    // Typed message dispatch between a player connection and the game modules.
    class Gateway
    {
      public:
        Gateway(modules::Wallet& wallet, modules::Rounds& rounds, modules::SettlementPipeline& pipeline,
                modules::VaultLedger const* vault, PlayerRegistry& registry, GatewaySettings const& settings,
                std::optional<std::filesystem::path> const log_path);

        auto on_message(PlayerContext& context, std::string_view const line, modules::Clock::time_point const now)
            -> Response;

        auto on_tick(PlayerContext& context, modules::Clock::time_point const now) -> std::vector<Response>;

        // Expires the open round and releases the identity. A resolved round is queued, or expired when it
        // still cannot be queued.
        auto on_closed(PlayerContext& context, modules::Clock::time_point const now) -> void;

      private:
        modules::Wallet* m_wallet;
        modules::Rounds* m_rounds;
        modules::SettlementPipeline* m_pipeline;
        modules::VaultLedger const* m_vault;
        PlayerRegistry* m_registry;
        GatewaySettings m_settings;
        std::shared_ptr<spdlog::logger> m_logger;

        auto hello(PlayerContext& context, nlohmann::json const& payload) -> Response;

        auto deposit(modules::GameSession& game, nlohmann::json const& payload) -> Response;

        auto balance(modules::GameSession& game) -> Response;

        auto submit_commitment(PlayerContext& context, nlohmann::json const& payload,
                               modules::Clock::time_point const now) -> Response;

        auto reveal(PlayerContext& context, nlohmann::json const& payload, modules::Clock::time_point const now)
            -> Response;

        // Queues the resolved round. Until that succeeds the round is kept on the context.
        auto hand_off(PlayerContext& context, modules::ResolvedRound const& resolved_round,
                      modules::Clock::time_point const now) -> bool;

        auto settlement_status(modules::GameSession& game, nlohmann::json const& payload) -> Response;

        auto vault(modules::Clock::time_point const now) -> Response;

        // Records the terminal state and returns the wager to the player. On failure storage keeps the round
        // awaiting reveal.
        auto release_round(modules::Round const& round) -> bool;

        static auto resolved(modules::Round const& round) -> Response;

        static auto error(core::ErrorCode const error_code, std::string_view const message) -> Response;
    };
} // namespace house
