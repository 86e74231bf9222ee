#include "fairness.hpp"
#include "precompiled.hpp"
#include <array>
#include <cctype>
#include <boost/multiprecision/cpp_int.hpp>
#include <botan/hash.h>
#include <botan/hex.h>
#include <botan/mem_ops.h>
#include <botan/system_rng.h>
#include <stdexcept>
#include <vector>

namespace house::core
{
    namespace
    {
        auto decode_hex32(std::string_view const value) -> std::vector<uint8_t>
        {
            if (!is_hex32(value))
            {
                throw std::invalid_argument("expected 0x-prefixed 32 byte hex value");
            }
            return Botan::hex_decode(value.substr(2));
        }

        auto to_prefixed_hex(std::span<uint8_t const> const bytes) -> std::string
        {
            return "0x" + Botan::hex_encode(bytes.data(), bytes.size(), false);
        }

        auto keccak256(std::span<uint8_t const> const bytes) -> std::vector<uint8_t>
        {
            auto keccak = Botan::HashFunction::create_or_throw("Keccak-1600(256)");
            keccak->update(bytes.data(), bytes.size());
            auto const digest = keccak->final();
            return std::vector<uint8_t>(digest.begin(), digest.end());
        }

        auto commitment_digest(uint64_t const wager, CoinChoice const choice, std::string_view const nonce)
            -> std::vector<uint8_t>
        {
            auto const nonce_bytes = decode_hex32(nonce);

            std::array<uint8_t, 32 + 1 + kNonceBytes> packed{};
            for (size_t i = 0; i < sizeof(uint64_t); ++i)
            {
                packed[31 - i] = static_cast<uint8_t>(wager >> (8 * i));
            }
            packed[32] = static_cast<uint8_t>(choice);
            std::copy(nonce_bytes.begin(), nonce_bytes.end(), packed.begin() + 33);

            return keccak256(packed);
        }
    } // namespace

    auto parse_choice(std::string_view const value) -> std::optional<CoinChoice>
    {
        if (value == "heads")
        {
            return CoinChoice::Heads;
        }
        if (value == "tails")
        {
            return CoinChoice::Tails;
        }
        return std::nullopt;
    }

    auto to_string(CoinChoice const choice) -> std::string_view
    {
        return choice == CoinChoice::Heads ? "heads" : "tails";
    }

    auto is_hex32(std::string_view const value) -> bool
    {
        if (value.size() != kNonceLength || value[0] != '0' || (value[1] != 'x' && value[1] != 'X'))
        {
            return false;
        }
        return std::all_of(value.begin() + 2, value.end(),
                           [](char const c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
    }

    auto generate_nonce() -> std::string
    {
        auto const bytes = Botan::system_rng().random_vec(kNonceBytes);
        return to_prefixed_hex(bytes);
    }

    auto create_commitment(uint64_t const wager, CoinChoice const choice, std::string_view const nonce) -> std::string
    {
        return to_prefixed_hex(commitment_digest(wager, choice, nonce));
    }

    auto verify_commitment(std::string_view const commitment, uint64_t const wager, CoinChoice const choice,
                           std::string_view const nonce) -> bool
    {
        if (!is_hex32(commitment) || !is_hex32(nonce))
        {
            return false;
        }

        auto const expected = commitment_digest(wager, choice, nonce);
        auto const provided = Botan::hex_decode(commitment.substr(2));
        return Botan::constant_time_compare(expected.data(), provided.data(), expected.size());
    }

    auto house_commitment(std::string_view const house_nonce) -> std::string
    {
        return to_prefixed_hex(keccak256(decode_hex32(house_nonce)));
    }

    auto verify_house_commitment(std::string_view const commitment, std::string_view const house_nonce) -> bool
    {
        if (!is_hex32(commitment) || !is_hex32(house_nonce))
        {
            return false;
        }

        auto const expected = keccak256(decode_hex32(house_nonce));
        auto const provided = Botan::hex_decode(commitment.substr(2));
        return Botan::constant_time_compare(expected.data(), provided.data(), expected.size());
    }

    auto derive_result(std::string_view const player_nonce, std::string_view const house_nonce) -> CoinChoice
    {
        auto combined = decode_hex32(player_nonce);
        auto const house_bytes = decode_hex32(house_nonce);
        combined.insert(combined.end(), house_bytes.begin(), house_bytes.end());

        auto const digest = keccak256(combined);
        return (digest.back() % 2 == 0) ? CoinChoice::Heads : CoinChoice::Tails;
    }

    auto calculate_payout(uint64_t const wager, bool const won, uint32_t const house_edge_bps) -> uint64_t
    {
        if (house_edge_bps > kBpsBase)
        {
            throw std::invalid_argument("house edge must be within [0, 10000] basis points");
        }

        if (!won)
        {
            return 0;
        }

        boost::multiprecision::uint128_t payout = wager;
        payout *= 2 * (kBpsBase - house_edge_bps);
        payout /= kBpsBase;
        return payout.convert_to<uint64_t>();
    }
} // namespace house::core
