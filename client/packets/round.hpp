#pragma once

#include "packet.hpp"

namespace house::packets
{
    struct CommittedInfo
    {
        std::string round_id;
        std::string house_commitment;
    };

    struct ResolvedInfo
    {
        std::string round_id;
        core::CoinChoice outcome;
        bool won;
        uint64_t payout;
        std::string house_nonce;
        bool voided = false;
    };

    class SubmitCommitmentPacket : public Packet
    {
      public:
        SubmitCommitmentPacket(uint64_t const wager, core::CoinChoice const choice, std::string_view const commitment,
                               CommittedInfo& committed_info);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        uint64_t m_wager;
        core::CoinChoice m_choice;
        std::string_view m_commitment;

        CommittedInfo* m_committed_info;
    };

    class RevealPacket : public Packet
    {
      public:
        RevealPacket(std::string_view const nonce, ResolvedInfo& resolved_info);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        std::string_view m_nonce;

        ResolvedInfo* m_resolved_info;
    };

    class SettlementStatusPacket : public Packet
    {
      public:
        SettlementStatusPacket(std::string_view const round_id, std::string& status);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        std::string_view m_round_id;

        std::string* m_status;
    };
} // namespace house::packets
