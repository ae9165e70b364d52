#pragma once

#include <cstdint>
#include <string>

// Equipment description shared by world items and player slots
struct ItemDescriptor {
    std::string item_type;  // weapon, shield, armor
    std::string item_class; // e.g. "sword", "tower_shield"
    std::string name;
};

inline bool operator==(const ItemDescriptor &a, const ItemDescriptor &b) {
    return a.item_type == b.item_type && a.item_class == b.item_class &&
           a.name == b.name;
}
inline bool operator!=(const ItemDescriptor &a, const ItemDescriptor &b) {
    return !(a == b);
}

// An item lying in the world, waiting to be picked up
struct ItemView {
    std::uint32_t item_id = 0;
    std::string item_type;
    std::string item_class;
    std::string name;
    float x = 0.0f;
    float y = 0.0f;
};

inline bool operator==(const ItemView &a, const ItemView &b) {
    return a.item_id == b.item_id && a.item_type == b.item_type &&
           a.item_class == b.item_class && a.name == b.name && a.x == b.x &&
           a.y == b.y;
}
inline bool operator!=(const ItemView &a, const ItemView &b) {
    return !(a == b);
}
