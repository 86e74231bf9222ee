#include "session.hpp"
#include "precompiled.hpp"

namespace house::packets
{
    HelloPacket::HelloPacket(std::string_view const player_id, bool& welcomed)
        : Packet(core::MessageType::Hello), m_player_id(player_id), m_welcomed(&welcomed)
    {
    }

    auto HelloPacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type != core::MessageType::Welcome)
        {
            return false;
        }

        *m_welcomed = payload.at("playerId").get<std::string>() == m_player_id;
        return true;
    }

    auto HelloPacket::send(nlohmann::json& payload) -> void
    {
        payload["playerId"] = m_player_id;
    }

    DepositPacket::DepositPacket(uint64_t const amount, BalanceInfo& balance_info)
        : Packet(core::MessageType::Deposit), m_amount(amount), m_balance_info(&balance_info)
    {
    }

    auto DepositPacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type != core::MessageType::Balance)
        {
            return false;
        }

        *m_balance_info = payload;
        return true;
    }

    auto DepositPacket::send(nlohmann::json& payload) -> void
    {
        payload["amount"] = m_amount;
    }

    BalancePacket::BalancePacket(BalanceInfo& balance_info)
        : Packet(core::MessageType::Balance), m_balance_info(&balance_info)
    {
    }

    auto BalancePacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type != core::MessageType::Balance)
        {
            return false;
        }

        *m_balance_info = payload;
        return true;
    }

    auto BalancePacket::send(nlohmann::json& payload) -> void
    {
    }

    VaultPacket::VaultPacket(nlohmann::json& snapshot) : Packet(core::MessageType::Vault), m_snapshot(&snapshot)
    {
    }

    auto VaultPacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type != core::MessageType::Vault)
        {
            return false;
        }

        *m_snapshot = payload;
        return true;
    }

    auto VaultPacket::send(nlohmann::json& payload) -> void
    {
    }
} // namespace house::packets
