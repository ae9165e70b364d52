#include "packets.hpp"
#include <array>
#include <optional>
#include <string>

namespace {

// Indexed by MessageType
constexpr std::array<const char *, MESSAGE_TYPE_COUNT> kTags = {
    "welcome",      "player_joined", "player_left",   "player_update",
    "attack",       "player_attack", "enemy_damage",  "enemy_damaged",
    "enemy_died",   "pickup_item",   "item_picked_up", "game_state"};

} // namespace

const char *ToTag(MessageType type) {
    return kTags[static_cast<std::size_t>(type)];
}

std::optional<MessageType> FromTag(const std::string &tag) {
    for (std::size_t i = 0; i < kTags.size(); ++i) {
        if (tag == kTags[i])
            return static_cast<MessageType>(i);
    }
    return std::nullopt;
}

bool operator==(const WelcomePacket &a, const WelcomePacket &b) {
    return a.player_id == b.player_id && a.game_state == b.game_state;
}

bool operator==(const PlayerJoinedPacket &a, const PlayerJoinedPacket &b) {
    return a.player_id == b.player_id;
}

bool operator==(const PlayerLeftPacket &a, const PlayerLeftPacket &b) {
    return a.player_id == b.player_id;
}

bool operator==(const PlayerUpdatePacket &a, const PlayerUpdatePacket &b) {
    return a.player == b.player;
}

bool operator==(const AttackPacket &a, const AttackPacket &b) {
    return a.attack_data == b.attack_data;
}

bool operator==(const PlayerAttackPacket &a, const PlayerAttackPacket &b) {
    return a.player_id == b.player_id && a.attack_data == b.attack_data;
}

bool operator==(const EnemyDamagePacket &a, const EnemyDamagePacket &b) {
    return a.enemy_id == b.enemy_id && a.damage == b.damage &&
           a.drops == b.drops;
}

bool operator==(const EnemyDamagedPacket &a, const EnemyDamagedPacket &b) {
    return a.enemy_id == b.enemy_id && a.hp == b.hp;
}

bool operator==(const EnemyDiedPacket &a, const EnemyDiedPacket &b) {
    return a.enemy_id == b.enemy_id && a.drops == b.drops;
}

bool operator==(const PickupItemPacket &a, const PickupItemPacket &b) {
    return a.item_id == b.item_id;
}

bool operator==(const ItemPickedUpPacket &a, const ItemPickedUpPacket &b) {
    return a.item_id == b.item_id && a.player_id == b.player_id;
}

bool operator==(const GameStatePacket &a, const GameStatePacket &b) {
    return a.game_state == b.game_state;
}
