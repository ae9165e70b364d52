#include "state_store.hpp"
#include <utility>

state_store::state_store(GameStateSnapshot initial)
    : m_state(std::move(initial)) {}

GameStateSnapshot state_store::snapshot() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

template <typename T>
void state_store::drop_retired(std::map<uint32_t, T> &entries,
                               const std::set<uint32_t> &retired) {
    for (auto it = entries.begin(); it != entries.end();) {
        if (retired.count(it->first)) {
            it = entries.erase(it);
        } else {
            ++it;
        }
    }
}

void state_store::update_game_state(const StateUpdate &update) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (update.players) {
        m_state.players = *update.players;
        drop_retired(m_state.players, m_retiredPlayers);
    }
    if (update.enemies) {
        m_state.enemies = *update.enemies;
        drop_retired(m_state.enemies, m_retiredEnemies);
    }
    if (update.items) {
        m_state.items = *update.items;
        drop_retired(m_state.items, m_retiredItems);
    }
    if (update.dungeon)
        m_state.dungeon = *update.dungeon;
    if (update.level)
        m_state.level = *update.level;
}

bool state_store::update_player(uint32_t player_id, PlayerView view) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_retiredPlayers.count(player_id))
        return false;
    view.player_id = player_id; // The session id is authoritative
    m_state.players[player_id] = std::move(view);
    return true;
}

bool state_store::remove_player(uint32_t player_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_retiredPlayers.insert(player_id);
    return m_state.players.erase(player_id) > 0;
}

damage_result state_store::apply_enemy_damage(uint32_t enemy_id,
                                              float damage) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_state.enemies.find(enemy_id);
    if (it == m_state.enemies.end())
        return {damage_outcome::missing, 0.0f};

    it->second.hp -= damage;
    if (it->second.hp <= 0.0f) {
        m_state.enemies.erase(it);
        m_retiredEnemies.insert(enemy_id);
        return {damage_outcome::died, 0.0f};
    }
    return {damage_outcome::damaged, it->second.hp};
}

bool state_store::take_item(uint32_t item_id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_state.items.erase(item_id) == 0)
        return false;
    m_retiredItems.insert(item_id);
    return true;
}

bool state_store::has_player(uint32_t player_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.players.count(player_id) > 0;
}

bool state_store::has_enemy(uint32_t enemy_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.enemies.count(enemy_id) > 0;
}

bool state_store::has_item(uint32_t item_id) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state.items.count(item_id) > 0;
}
