#include "message_router.hpp"
#include <cmath>
#include <iostream>
#include <utility>

message_router::message_router(state_store &store, broadcast_fn broadcast)
    : m_store(store), m_broadcast(std::move(broadcast)) {}

void message_router::handle_message(uint32_t sender_id,
                                    const Message &message) {
    switch (message.GetType()) {
    case MessageType::PlayerUpdate:
        handle_player_update(sender_id, message.As<PlayerUpdatePacket>());
        break;
    case MessageType::Attack:
        handle_attack(sender_id, message.As<AttackPacket>());
        break;
    case MessageType::EnemyDamage:
        handle_enemy_damage(sender_id, message.As<EnemyDamagePacket>());
        break;
    case MessageType::PickupItem:
        handle_pickup_item(sender_id, message.As<PickupItemPacket>());
        break;
    default:
        // Host-to-client messages have no meaning here
        std::cerr << "[message_router] Ignoring '" << message.GetTag()
                  << "' from player " << sender_id << std::endl;
        break;
    }
}

void message_router::handle_player_update(uint32_t sender_id,
                                          const PlayerUpdatePacket &packet) {
    // Absorbed into the next periodic broadcast
    if (!m_store.update_player(sender_id, packet.player)) {
        std::cerr << "[message_router] Dropped update for departed player "
                  << sender_id << std::endl;
    }
}

void message_router::handle_attack(uint32_t sender_id,
                                   const AttackPacket &packet) {
    PlayerAttackPacket relay;
    relay.player_id = sender_id;
    relay.attack_data = packet.attack_data;
    m_broadcast(Message(relay));
}

void message_router::handle_enemy_damage(uint32_t sender_id,
                                         const EnemyDamagePacket &packet) {
    // NaN would leave the enemy unkillable, negative damage would heal it
    if (!std::isfinite(packet.damage) || packet.damage < 0.0f) {
        std::cerr << "[message_router] Dropped invalid damage "
                  << packet.damage << " from player " << sender_id
                  << std::endl;
        return;
    }

    damage_result result =
        m_store.apply_enemy_damage(packet.enemy_id, packet.damage);

    switch (result.outcome) {
    case damage_outcome::missing:
        // Already dead, another hit resolved it first
        break;
    case damage_outcome::damaged: {
        EnemyDamagedPacket damaged;
        damaged.enemy_id = packet.enemy_id;
        damaged.hp = result.hp;
        m_broadcast(Message(damaged));
        break;
    }
    case damage_outcome::died: {
        EnemyDiedPacket died;
        died.enemy_id = packet.enemy_id;
        died.drops = packet.drops;
        std::cout << "[message_router] Enemy " << packet.enemy_id
                  << " killed by player " << sender_id << std::endl;
        m_broadcast(Message(died));
        break;
    }
    }
}

void message_router::handle_pickup_item(uint32_t sender_id,
                                        const PickupItemPacket &packet) {
    if (!m_store.take_item(packet.item_id))
        return;

    ItemPickedUpPacket picked;
    picked.item_id = packet.item_id;
    picked.player_id = sender_id;
    m_broadcast(Message(picked));
}
