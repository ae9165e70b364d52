#pragma once

#include <cstdint>
#include <vector>

struct RoomView {
    std::int32_t room_id = 0;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    bool cleared = false;
    std::vector<std::int32_t> connected_rooms;
};

inline bool operator==(const RoomView &a, const RoomView &b) {
    return a.room_id == b.room_id && a.x == b.x && a.y == b.y &&
           a.width == b.width && a.height == b.height &&
           a.cleared == b.cleared && a.connected_rooms == b.connected_rooms;
}
inline bool operator!=(const RoomView &a, const RoomView &b) {
    return !(a == b);
}

// Layout produced by dungeon generation. Opaque to the network core.
struct DungeonDescriptor {
    std::int32_t level = 1;
    std::int32_t room_count = 0;
    std::vector<RoomView> rooms;
    float spawn_x = 0.0f;
    float spawn_y = 0.0f;
};

inline bool operator==(const DungeonDescriptor &a,
                       const DungeonDescriptor &b) {
    return a.level == b.level && a.room_count == b.room_count &&
           a.rooms == b.rooms && a.spawn_x == b.spawn_x &&
           a.spawn_y == b.spawn_y;
}
inline bool operator!=(const DungeonDescriptor &a,
                       const DungeonDescriptor &b) {
    return !(a == b);
}
