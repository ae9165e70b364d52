#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct EnemyView {
    std::uint32_t enemy_id = 0;
    std::string type; // larva, ant, wasp
    float x = 0.0f;
    float y = 0.0f;
    float hp = 0.0f;
    float max_hp = 0.0f;
    std::string state;                   // idle, chasing, wandering...
    std::optional<std::uint32_t> target; // Player being chased
    std::int32_t room_id = -1;
    float spawn_x = 0.0f;
    float spawn_y = 0.0f;
    float velocity_x = 0.0f;
    float velocity_y = 0.0f;
    bool has_bow = false;
};

inline bool operator==(const EnemyView &a, const EnemyView &b) {
    return a.enemy_id == b.enemy_id && a.type == b.type && a.x == b.x &&
           a.y == b.y && a.hp == b.hp && a.max_hp == b.max_hp &&
           a.state == b.state && a.target == b.target &&
           a.room_id == b.room_id && a.spawn_x == b.spawn_x &&
           a.spawn_y == b.spawn_y && a.velocity_x == b.velocity_x &&
           a.velocity_y == b.velocity_y && a.has_bow == b.has_bow;
}
inline bool operator!=(const EnemyView &a, const EnemyView &b) {
    return !(a == b);
}
