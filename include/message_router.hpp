#pragma once

#include "message.hpp"
#include "packets.hpp"
#include "state_store.hpp"
#include <cstdint>
#include <functional>

// Applies client intents to the authoritative store and emits the reactive
// broadcasts. Only the host runs this. Damage arrives already computed by
// combat logic; the router only checks that its target still exists.
class message_router {
public:
  using broadcast_fn = std::function<void(const Message &)>;

  message_router(state_store &store, broadcast_fn broadcast);

  // Safe to call concurrently for different senders
  void handle_message(uint32_t sender_id, const Message &message);

private:
  void handle_player_update(uint32_t sender_id,
                            const PlayerUpdatePacket &packet);
  void handle_attack(uint32_t sender_id, const AttackPacket &packet);
  void handle_enemy_damage(uint32_t sender_id,
                           const EnemyDamagePacket &packet);
  void handle_pickup_item(uint32_t sender_id, const PickupItemPacket &packet);

  state_store &m_store;
  broadcast_fn m_broadcast;
};
