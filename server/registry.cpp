#include "registry.hpp"
#include "precompiled.hpp"

namespace house
{
    auto PlayerRegistry::try_register(std::string_view const player_id, uint64_t const session_id) -> bool
    {
        std::lock_guard lock(m_mutex);
        return m_players.emplace(std::string(player_id), session_id).second;
    }

    auto PlayerRegistry::remove(std::string_view const player_id, uint64_t const session_id) -> bool
    {
        std::lock_guard lock(m_mutex);
        auto it = m_players.find(std::string(player_id));
        if (it == m_players.end() || it->second != session_id)
        {
            return false;
        }

        m_players.erase(it);
        return true;
    }

    auto PlayerRegistry::session_of(std::string_view const player_id) const -> std::optional<uint64_t>
    {
        std::lock_guard lock(m_mutex);
        auto it = m_players.find(std::string(player_id));
        if (it == m_players.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    auto PlayerRegistry::size() const -> size_t
    {
        std::lock_guard lock(m_mutex);
        return m_players.size();
    }
} // namespace house
