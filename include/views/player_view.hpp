#pragma once

#include "item_view.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>

struct PlayerView {
    std::uint32_t player_id = 0;
    std::string name;
    float x = 0.0f;
    float y = 0.0f;
    float hp = 100.0f;
    float max_hp = 100.0f;
    float stamina = 100.0f;
    float max_stamina = 100.0f;
    float facing_angle = 0.0f; // Radians
    bool is_attacking = false;
    bool is_blocking = false;
    bool is_sprinting = false;
    // Slot name -> equipped item (empty slot when nullopt)
    std::map<std::string, std::optional<ItemDescriptor>> equipped;
};

inline bool operator==(const PlayerView &a, const PlayerView &b) {
    return a.player_id == b.player_id && a.name == b.name && a.x == b.x &&
           a.y == b.y && a.hp == b.hp && a.max_hp == b.max_hp &&
           a.stamina == b.stamina && a.max_stamina == b.max_stamina &&
           a.facing_angle == b.facing_angle &&
           a.is_attacking == b.is_attacking &&
           a.is_blocking == b.is_blocking &&
           a.is_sprinting == b.is_sprinting && a.equipped == b.equipped;
}
inline bool operator!=(const PlayerView &a, const PlayerView &b) {
    return !(a == b);
}

// Attack swing as reported by the attacking player. Cosmetic on the wire.
struct AttackData {
    float damage = 0.0f;
    float range = 0.0f;
    float angle = 0.0f;
    float x = 0.0f;
    float y = 0.0f;
};

inline bool operator==(const AttackData &a, const AttackData &b) {
    return a.damage == b.damage && a.range == b.range && a.angle == b.angle &&
           a.x == b.x && a.y == b.y;
}
inline bool operator!=(const AttackData &a, const AttackData &b) {
    return !(a == b);
}
