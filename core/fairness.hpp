#pragma once

#include "common.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace house::core
{
    // "0x" followed by 32 bytes in lowercase hex
    constexpr size_t kNonceBytes = 32;
    constexpr size_t kNonceLength = 2 + kNonceBytes * 2;
    constexpr size_t kDigestLength = kNonceLength;

    auto parse_choice(std::string_view const value) -> std::optional<CoinChoice>;

    auto to_string(CoinChoice const choice) -> std::string_view;

    // Checks the "0x" + 64 hex digit shape shared by nonces and commitments.
    auto is_hex32(std::string_view const value) -> bool;

    auto generate_nonce() -> std::string;

    // Keccak-256 over wager (32 bytes, big-endian) || choice (1 byte) || nonce (32 bytes).
    // Throws std::invalid_argument on a malformed nonce.
    auto create_commitment(uint64_t const wager, CoinChoice const choice, std::string_view const nonce) -> std::string;

    auto verify_commitment(std::string_view const commitment, uint64_t const wager, CoinChoice const choice,
                           std::string_view const nonce) -> bool;

    // Keccak-256 of the house nonce, published before the player reveals.
    auto house_commitment(std::string_view const house_nonce) -> std::string;

    auto verify_house_commitment(std::string_view const commitment, std::string_view const house_nonce) -> bool;

    // Low bit of Keccak-256(player_nonce || house_nonce). Throws std::invalid_argument on malformed nonces.
    auto derive_result(std::string_view const player_nonce, std::string_view const house_nonce) -> CoinChoice;

    auto calculate_payout(uint64_t const wager, bool const won, uint32_t const house_edge_bps = kDefaultHouseEdgeBps)
        -> uint64_t;
} // namespace house::core
