#pragma once

#include "dungeon_descriptor.hpp"
#include "enemy_view.hpp"
#include "item_view.hpp"
#include "player_view.hpp"
#include <cstdint>
#include <map>
#include <optional>

// Full world snapshot. Canonical on the host, a read-only copy on clients.
struct GameStateSnapshot {
    std::map<std::uint32_t, PlayerView> players;
    std::map<std::uint32_t, EnemyView> enemies;
    std::map<std::uint32_t, ItemView> items;
    DungeonDescriptor dungeon;
    std::int32_t level = 1;
};

inline bool operator==(const GameStateSnapshot &a,
                       const GameStateSnapshot &b) {
    return a.players == b.players && a.enemies == b.enemies &&
           a.items == b.items && a.dungeon == b.dungeon && a.level == b.level;
}
inline bool operator!=(const GameStateSnapshot &a,
                       const GameStateSnapshot &b) {
    return !(a == b);
}

// Partial update from world generation / AI / combat logic.
// Present fields replace the matching snapshot field wholesale.
struct StateUpdate {
    std::optional<std::map<std::uint32_t, PlayerView>> players;
    std::optional<std::map<std::uint32_t, EnemyView>> enemies;
    std::optional<std::map<std::uint32_t, ItemView>> items;
    std::optional<DungeonDescriptor> dungeon;
    std::optional<std::int32_t> level;
};
