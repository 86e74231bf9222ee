#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>

namespace house::core
{
    enum class MessageType : uint16_t
    {
        Unknown,
        // Inbound
        Hello,
        SubmitCommitment,
        Reveal,
        Ping,
        Deposit,
        Balance,
        SettlementStatus,
        Vault,
        // Outbound
        Welcome,
        Committed,
        Resolved,
        Voided,
        Expired,
        Error,
        Pong,
        Heartbeat,
        Settlement
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(MessageType, {{MessageType::Unknown, nullptr},
                                               {MessageType::Hello, "hello"},
                                               {MessageType::SubmitCommitment, "submitCommitment"},
                                               {MessageType::Reveal, "reveal"},
                                               {MessageType::Ping, "ping"},
                                               {MessageType::Deposit, "deposit"},
                                               {MessageType::Balance, "balance"},
                                               {MessageType::SettlementStatus, "settlementStatus"},
                                               {MessageType::Vault, "vault"},
                                               {MessageType::Welcome, "welcome"},
                                               {MessageType::Committed, "committed"},
                                               {MessageType::Resolved, "resolved"},
                                               {MessageType::Voided, "voided"},
                                               {MessageType::Expired, "expired"},
                                               {MessageType::Error, "error"},
                                               {MessageType::Pong, "pong"},
                                               {MessageType::Heartbeat, "heartbeat"},
                                               {MessageType::Settlement, "settlement"}})

    enum class ErrorCode : uint16_t
    {
        Success = 0,
        ValidationError = 1,
        FairnessViolation = 2,
        TransientInfrastructureError = 3,
        SolvencyError = 4,
        TimeoutError = 5,
        RoundConflict = 6,
        NotIdentified = 7,
        IdentityInUse = 8,
        NotFound = 9,
        UnknownMessage = 10
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(ErrorCode, {{ErrorCode::Success, "Success"},
                                             {ErrorCode::ValidationError, "ValidationError"},
                                             {ErrorCode::FairnessViolation, "FairnessViolation"},
                                             {ErrorCode::TransientInfrastructureError, "TransientInfrastructureError"},
                                             {ErrorCode::SolvencyError, "SolvencyError"},
                                             {ErrorCode::TimeoutError, "TimeoutError"},
                                             {ErrorCode::RoundConflict, "RoundConflict"},
                                             {ErrorCode::NotIdentified, "NotIdentified"},
                                             {ErrorCode::IdentityInUse, "IdentityInUse"},
                                             {ErrorCode::NotFound, "NotFound"},
                                             {ErrorCode::UnknownMessage, "UnknownMessage"}})

    enum class CoinChoice : uint8_t
    {
        Heads = 0,
        Tails = 1
    };

    NLOHMANN_JSON_SERIALIZE_ENUM(CoinChoice, {{CoinChoice::Heads, "heads"}, {CoinChoice::Tails, "tails"}})

    // Basis points denominator for the house edge
    constexpr uint32_t kBpsBase = 10000;

    constexpr uint32_t kDefaultHouseEdgeBps = 200;
} // namespace house::core
