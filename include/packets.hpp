#pragma once

#include "views/game_state.hpp"
#include "views/player_view.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

// Order must match the alternatives of Payload below
enum class MessageType : uint8_t {
  Welcome,
  PlayerJoined,
  PlayerLeft,
  PlayerUpdate,
  Attack,
  PlayerAttack,
  EnemyDamage,
  EnemyDamaged,
  EnemyDied,
  PickupItem,
  ItemPickedUp,
  GameState
};

constexpr std::size_t MESSAGE_TYPE_COUNT = 12;

// Host -> new client: assigned id plus the current world
struct WelcomePacket {
  uint32_t player_id = 0;
  GameStateSnapshot game_state;
};

// Host -> everyone else
struct PlayerJoinedPacket {
  uint32_t player_id = 0;
};

struct PlayerLeftPacket {
  uint32_t player_id = 0;
};

// Client -> host. Replaces the sender's entry in the player map.
struct PlayerUpdatePacket {
  PlayerView player;
};

// Client -> host. Relayed as PlayerAttackPacket, no effect on state.
struct AttackPacket {
  AttackData attack_data;
};

struct PlayerAttackPacket {
  uint32_t player_id = 0;
  AttackData attack_data;
};

// Client -> host. Damage already computed by combat logic.
struct EnemyDamagePacket {
  uint32_t enemy_id = 0;
  float damage = 0.0f;
  std::vector<std::string> drops; // Item names dropped if this hit kills
};

struct EnemyDamagedPacket {
  uint32_t enemy_id = 0;
  float hp = 0.0f;
};

struct EnemyDiedPacket {
  uint32_t enemy_id = 0;
  std::vector<std::string> drops;
};

// Client -> host
struct PickupItemPacket {
  uint32_t item_id = 0;
};

struct ItemPickedUpPacket {
  uint32_t item_id = 0;
  uint32_t player_id = 0;
};

// Host -> all, every tick
struct GameStatePacket {
  GameStateSnapshot game_state;
};

using Payload =
    std::variant<WelcomePacket, PlayerJoinedPacket, PlayerLeftPacket,
                 PlayerUpdatePacket, AttackPacket, PlayerAttackPacket,
                 EnemyDamagePacket, EnemyDamagedPacket, EnemyDiedPacket,
                 PickupItemPacket, ItemPickedUpPacket, GameStatePacket>;

static_assert(std::variant_size_v<Payload> == MESSAGE_TYPE_COUNT,
              "every message type needs exactly one payload shape");

// Wire tags
const char *ToTag(MessageType type);
std::optional<MessageType> FromTag(const std::string &tag);

// Index of a payload alternative, i.e. the MessageType it belongs to
template <typename T, typename V> struct payload_index;

template <typename T, typename... Ts>
struct payload_index<T, std::variant<T, Ts...>>
    : std::integral_constant<std::size_t, 0> {};

template <typename T, typename U, typename... Ts>
struct payload_index<T, std::variant<U, Ts...>>
    : std::integral_constant<
          std::size_t, 1 + payload_index<T, std::variant<Ts...>>::value> {};

template <typename T> constexpr MessageType MessageTypeOf() {
  return static_cast<MessageType>(payload_index<T, Payload>::value);
}

bool operator==(const WelcomePacket &a, const WelcomePacket &b);
bool operator==(const PlayerJoinedPacket &a, const PlayerJoinedPacket &b);
bool operator==(const PlayerLeftPacket &a, const PlayerLeftPacket &b);
bool operator==(const PlayerUpdatePacket &a, const PlayerUpdatePacket &b);
bool operator==(const AttackPacket &a, const AttackPacket &b);
bool operator==(const PlayerAttackPacket &a, const PlayerAttackPacket &b);
bool operator==(const EnemyDamagePacket &a, const EnemyDamagePacket &b);
bool operator==(const EnemyDamagedPacket &a, const EnemyDamagedPacket &b);
bool operator==(const EnemyDiedPacket &a, const EnemyDiedPacket &b);
bool operator==(const PickupItemPacket &a, const PickupItemPacket &b);
bool operator==(const ItemPickedUpPacket &a, const ItemPickedUpPacket &b);
bool operator==(const GameStatePacket &a, const GameStatePacket &b);
