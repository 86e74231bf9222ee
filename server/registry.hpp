#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace house
{
    // Player identity -> owning connection. An entry is created when a connection identifies itself
    // and removed when that connection closes; one connection per identity at a time.
    class PlayerRegistry
    {
      public:
        auto try_register(std::string_view const player_id, uint64_t const session_id) -> bool;

        // Only the connection that registered the identity can remove it.
        auto remove(std::string_view const player_id, uint64_t const session_id) -> bool;

        auto session_of(std::string_view const player_id) const -> std::optional<uint64_t>;

        auto size() const -> size_t;

      private:
        mutable std::mutex m_mutex;
        std::unordered_map<std::string, uint64_t> m_players;
    };
} // namespace house
