#pragma once

#include "views/game_state.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <set>

enum class damage_outcome { missing, damaged, died };

struct damage_result {
  damage_outcome outcome = damage_outcome::missing;
  float hp = 0.0f; // Remaining hp, meaningful when damaged
};

// Authoritative world snapshot on the host. Every operation is one short
// critical section under the store mutex; callers never do I/O while it is
// held.
//
// Ids removed by a disconnect, death or pickup are retired and filtered out
// of later writes, so a removed entry never comes back under the same id.
class state_store {
public:
  state_store() = default;
  explicit state_store(GameStateSnapshot initial);

  // Deep copy taken under the lock
  GameStateSnapshot snapshot() const;

  // Replaces each field present in the update
  void update_game_state(const StateUpdate &update);

  // Returns false if the player id has been retired
  bool update_player(uint32_t player_id, PlayerView view);
  // Removes and retires the player. Returns false if there was no entry.
  bool remove_player(uint32_t player_id);

  damage_result apply_enemy_damage(uint32_t enemy_id, float damage);
  // Removes and retires the item. Returns false if it was already gone.
  bool take_item(uint32_t item_id);

  bool has_player(uint32_t player_id) const;
  bool has_enemy(uint32_t enemy_id) const;
  bool has_item(uint32_t item_id) const;

private:
  template <typename T>
  static void drop_retired(std::map<uint32_t, T> &entries,
                           const std::set<uint32_t> &retired);

  mutable std::mutex m_mutex;
  GameStateSnapshot m_state;
  std::set<uint32_t> m_retiredPlayers;
  std::set<uint32_t> m_retiredEnemies;
  std::set<uint32_t> m_retiredItems;
};
