#pragma once

#include "packet.hpp"

namespace house::packets
{
    struct BalanceInfo
    {
        uint64_t available;
        uint64_t reserved;
    };

    NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(house::packets::BalanceInfo, available, reserved)

    class HelloPacket : public Packet
    {
      public:
        HelloPacket(std::string_view const player_id, bool& welcomed);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        std::string_view m_player_id;

        bool* m_welcomed;
    };

    class DepositPacket : public Packet
    {
      public:
        DepositPacket(uint64_t const amount, BalanceInfo& balance_info);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        uint64_t m_amount;

        BalanceInfo* m_balance_info;
    };

    class BalancePacket : public Packet
    {
      public:
        BalancePacket(BalanceInfo& balance_info);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        BalanceInfo* m_balance_info;
    };

    class VaultPacket : public Packet
    {
      public:
        VaultPacket(nlohmann::json& snapshot);

      protected:
        auto accept(core::MessageType const message_type, nlohmann::json const& payload) -> bool override;

        auto send(nlohmann::json& payload) -> void override;

      private:
        nlohmann::json* m_snapshot;
    };
} // namespace house::packets
