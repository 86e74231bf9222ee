#include "round.hpp"
#include "precompiled.hpp"

namespace house::packets
{
    SubmitCommitmentPacket::SubmitCommitmentPacket(uint64_t const wager, core::CoinChoice const choice,
                                                   std::string_view const commitment, CommittedInfo& committed_info)
        : Packet(core::MessageType::SubmitCommitment), m_wager(wager), m_choice(choice), m_commitment(commitment),
          m_committed_info(&committed_info)
    {
    }

    auto SubmitCommitmentPacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type != core::MessageType::Committed)
        {
            return false;
        }

        m_committed_info->round_id = payload.at("roundId").get<std::string>();
        m_committed_info->house_commitment = payload.at("houseCommitment").get<std::string>();
        return true;
    }

    auto SubmitCommitmentPacket::send(nlohmann::json& payload) -> void
    {
        payload["wager"] = m_wager;
        payload["choice"] = m_choice;
        payload["commitment"] = m_commitment;
    }

    RevealPacket::RevealPacket(std::string_view const nonce, ResolvedInfo& resolved_info)
        : Packet(core::MessageType::Reveal), m_nonce(nonce), m_resolved_info(&resolved_info)
    {
    }

    auto RevealPacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type == core::MessageType::Voided)
        {
            m_resolved_info->round_id = payload.at("roundId").get<std::string>();
            m_resolved_info->voided = true;
            return true;
        }

        if (message_type != core::MessageType::Resolved)
        {
            return false;
        }

        m_resolved_info->round_id = payload.at("roundId").get<std::string>();
        m_resolved_info->outcome = payload.at("outcome").get<core::CoinChoice>();
        m_resolved_info->won = payload.at("won").get<bool>();
        m_resolved_info->payout = payload.at("payout").get<uint64_t>();
        m_resolved_info->house_nonce = payload.at("houseNonce").get<std::string>();
        return true;
    }

    auto RevealPacket::send(nlohmann::json& payload) -> void
    {
        payload["nonce"] = m_nonce;
    }

    SettlementStatusPacket::SettlementStatusPacket(std::string_view const round_id, std::string& status)
        : Packet(core::MessageType::SettlementStatus), m_round_id(round_id), m_status(&status)
    {
    }

    auto SettlementStatusPacket::accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool
    {
        if (message_type != core::MessageType::Settlement || payload.at("roundId").get<std::string>() != m_round_id)
        {
            return false;
        }

        *m_status = payload.at("status").get<std::string>();
        return true;
    }

    auto SettlementStatusPacket::send(nlohmann::json& payload) -> void
    {
        payload["roundId"] = m_round_id;
    }
} // namespace house::packets
