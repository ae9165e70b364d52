#include "message_codec.hpp"
#include "config.hpp"
#include "errors.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace {

std::size_t Remaining(const sf::Packet &packet) {
    return packet.getDataSize() - packet.getReadPosition();
}

// Every element takes at least one byte, so a count larger than the rest of
// the frame can only come from a corrupt or hostile sender.
std::uint32_t ReadCount(sf::Packet &packet) {
    std::uint32_t count = 0;
    if (!(packet >> count))
        throw CodecError("truncated collection header");
    if (count > Remaining(packet))
        throw CodecError("collection count " + std::to_string(count) +
                         " exceeds frame size");
    return count;
}

void WriteStrings(sf::Packet &packet, const std::vector<std::string> &values) {
    packet << static_cast<std::uint32_t>(values.size());
    for (auto const &value : values)
        packet << value;
}

void ReadStrings(sf::Packet &packet, std::vector<std::string> &values) {
    values.clear();
    std::uint32_t count = ReadCount(packet);
    values.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::string value;
        if (!(packet >> value))
            throw CodecError("truncated string list");
        values.push_back(std::move(value));
    }
}

template <typename T>
void WriteMap(sf::Packet &packet, const std::map<std::uint32_t, T> &entries) {
    packet << static_cast<std::uint32_t>(entries.size());
    for (auto const &[id, entry] : entries)
        packet << id << entry;
}

template <typename T>
void ReadMap(sf::Packet &packet, std::map<std::uint32_t, T> &entries) {
    entries.clear();
    std::uint32_t count = ReadCount(packet);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::uint32_t id = 0;
        T entry;
        if (!(packet >> id >> entry))
            throw CodecError("truncated map entry");
        if (!entries.emplace(id, std::move(entry)).second)
            throw CodecError("duplicate id " + std::to_string(id));
    }
}

// Payload schema, one writer and one reader per message type

void WritePayload(sf::Packet &packet, const WelcomePacket &p) {
    packet << p.player_id << p.game_state;
}
void ReadPayload(sf::Packet &packet, WelcomePacket &p) {
    packet >> p.player_id >> p.game_state;
}

void WritePayload(sf::Packet &packet, const PlayerJoinedPacket &p) {
    packet << p.player_id;
}
void ReadPayload(sf::Packet &packet, PlayerJoinedPacket &p) {
    packet >> p.player_id;
}

void WritePayload(sf::Packet &packet, const PlayerLeftPacket &p) {
    packet << p.player_id;
}
void ReadPayload(sf::Packet &packet, PlayerLeftPacket &p) {
    packet >> p.player_id;
}

void WritePayload(sf::Packet &packet, const PlayerUpdatePacket &p) {
    packet << p.player;
}
void ReadPayload(sf::Packet &packet, PlayerUpdatePacket &p) {
    packet >> p.player;
}

void WritePayload(sf::Packet &packet, const AttackPacket &p) {
    packet << p.attack_data;
}
void ReadPayload(sf::Packet &packet, AttackPacket &p) {
    packet >> p.attack_data;
}

void WritePayload(sf::Packet &packet, const PlayerAttackPacket &p) {
    packet << p.player_id << p.attack_data;
}
void ReadPayload(sf::Packet &packet, PlayerAttackPacket &p) {
    packet >> p.player_id >> p.attack_data;
}

void WritePayload(sf::Packet &packet, const EnemyDamagePacket &p) {
    packet << p.enemy_id << p.damage;
    WriteStrings(packet, p.drops);
}
void ReadPayload(sf::Packet &packet, EnemyDamagePacket &p) {
    packet >> p.enemy_id >> p.damage;
    ReadStrings(packet, p.drops);
}

void WritePayload(sf::Packet &packet, const EnemyDamagedPacket &p) {
    packet << p.enemy_id << p.hp;
}
void ReadPayload(sf::Packet &packet, EnemyDamagedPacket &p) {
    packet >> p.enemy_id >> p.hp;
}

void WritePayload(sf::Packet &packet, const EnemyDiedPacket &p) {
    packet << p.enemy_id;
    WriteStrings(packet, p.drops);
}
void ReadPayload(sf::Packet &packet, EnemyDiedPacket &p) {
    packet >> p.enemy_id;
    ReadStrings(packet, p.drops);
}

void WritePayload(sf::Packet &packet, const PickupItemPacket &p) {
    packet << p.item_id;
}
void ReadPayload(sf::Packet &packet, PickupItemPacket &p) {
    packet >> p.item_id;
}

void WritePayload(sf::Packet &packet, const ItemPickedUpPacket &p) {
    packet << p.item_id << p.player_id;
}
void ReadPayload(sf::Packet &packet, ItemPickedUpPacket &p) {
    packet >> p.item_id >> p.player_id;
}

void WritePayload(sf::Packet &packet, const GameStatePacket &p) {
    packet << p.game_state;
}
void ReadPayload(sf::Packet &packet, GameStatePacket &p) {
    packet >> p.game_state;
}

template <typename T> Payload ReadAs(sf::Packet &packet) {
    T payload;
    ReadPayload(packet, payload);
    return payload;
}

Payload ReadPayloadOf(MessageType type, sf::Packet &packet) {
    switch (type) {
    case MessageType::Welcome:
        return ReadAs<WelcomePacket>(packet);
    case MessageType::PlayerJoined:
        return ReadAs<PlayerJoinedPacket>(packet);
    case MessageType::PlayerLeft:
        return ReadAs<PlayerLeftPacket>(packet);
    case MessageType::PlayerUpdate:
        return ReadAs<PlayerUpdatePacket>(packet);
    case MessageType::Attack:
        return ReadAs<AttackPacket>(packet);
    case MessageType::PlayerAttack:
        return ReadAs<PlayerAttackPacket>(packet);
    case MessageType::EnemyDamage:
        return ReadAs<EnemyDamagePacket>(packet);
    case MessageType::EnemyDamaged:
        return ReadAs<EnemyDamagedPacket>(packet);
    case MessageType::EnemyDied:
        return ReadAs<EnemyDiedPacket>(packet);
    case MessageType::PickupItem:
        return ReadAs<PickupItemPacket>(packet);
    case MessageType::ItemPickedUp:
        return ReadAs<ItemPickedUpPacket>(packet);
    case MessageType::GameState:
        return ReadAs<GameStatePacket>(packet);
    }
    throw CodecError("unhandled message type");
}

} // namespace

// Records

sf::Packet &operator<<(sf::Packet &packet, const ItemDescriptor &item) {
    return packet << item.item_type << item.item_class << item.name;
}

sf::Packet &operator>>(sf::Packet &packet, ItemDescriptor &item) {
    return packet >> item.item_type >> item.item_class >> item.name;
}

sf::Packet &operator<<(sf::Packet &packet, const PlayerView &player) {
    packet << player.player_id << player.name << player.x << player.y
           << player.hp << player.max_hp << player.stamina
           << player.max_stamina << player.facing_angle << player.is_attacking
           << player.is_blocking << player.is_sprinting;

    packet << static_cast<std::uint32_t>(player.equipped.size());
    for (auto const &[slot, equipped] : player.equipped) {
        packet << slot << equipped.has_value();
        if (equipped)
            packet << *equipped;
    }
    return packet;
}

sf::Packet &operator>>(sf::Packet &packet, PlayerView &player) {
    packet >> player.player_id >> player.name >> player.x >> player.y >>
        player.hp >> player.max_hp >> player.stamina >> player.max_stamina >>
        player.facing_angle >> player.is_attacking >> player.is_blocking >>
        player.is_sprinting;
    if (!packet)
        return packet;

    player.equipped.clear();
    std::uint32_t count = ReadCount(packet);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::string slot;
        bool occupied = false;
        if (!(packet >> slot >> occupied))
            throw CodecError("truncated equipment slot");
        std::optional<ItemDescriptor> equipped;
        if (occupied) {
            ItemDescriptor item;
            if (!(packet >> item))
                throw CodecError("truncated equipped item");
            equipped = std::move(item);
        }
        player.equipped[slot] = std::move(equipped);
    }
    return packet;
}

sf::Packet &operator<<(sf::Packet &packet, const AttackData &attack) {
    return packet << attack.damage << attack.range << attack.angle << attack.x
                  << attack.y;
}

sf::Packet &operator>>(sf::Packet &packet, AttackData &attack) {
    return packet >> attack.damage >> attack.range >> attack.angle >>
           attack.x >> attack.y;
}

sf::Packet &operator<<(sf::Packet &packet, const EnemyView &enemy) {
    packet << enemy.enemy_id << enemy.type << enemy.x << enemy.y << enemy.hp
           << enemy.max_hp << enemy.state << enemy.target.has_value();
    if (enemy.target)
        packet << *enemy.target;
    return packet << enemy.room_id << enemy.spawn_x << enemy.spawn_y
                  << enemy.velocity_x << enemy.velocity_y << enemy.has_bow;
}

sf::Packet &operator>>(sf::Packet &packet, EnemyView &enemy) {
    bool has_target = false;
    packet >> enemy.enemy_id >> enemy.type >> enemy.x >> enemy.y >>
        enemy.hp >> enemy.max_hp >> enemy.state >> has_target;
    enemy.target.reset();
    if (has_target) {
        std::uint32_t target = 0;
        if (packet >> target)
            enemy.target = target;
    }
    return packet >> enemy.room_id >> enemy.spawn_x >> enemy.spawn_y >>
           enemy.velocity_x >> enemy.velocity_y >> enemy.has_bow;
}

sf::Packet &operator<<(sf::Packet &packet, const ItemView &item) {
    return packet << item.item_id << item.item_type << item.item_class
                  << item.name << item.x << item.y;
}

sf::Packet &operator>>(sf::Packet &packet, ItemView &item) {
    return packet >> item.item_id >> item.item_type >> item.item_class >>
           item.name >> item.x >> item.y;
}

sf::Packet &operator<<(sf::Packet &packet, const RoomView &room) {
    packet << room.room_id << room.x << room.y << room.width << room.height
           << room.cleared;
    packet << static_cast<std::uint32_t>(room.connected_rooms.size());
    for (std::int32_t connected : room.connected_rooms)
        packet << connected;
    return packet;
}

sf::Packet &operator>>(sf::Packet &packet, RoomView &room) {
    packet >> room.room_id >> room.x >> room.y >> room.width >> room.height >>
        room.cleared;
    if (!packet)
        return packet;

    room.connected_rooms.clear();
    std::uint32_t count = ReadCount(packet);
    for (std::uint32_t i = 0; i < count; ++i) {
        std::int32_t connected = 0;
        if (!(packet >> connected))
            throw CodecError("truncated room connections");
        room.connected_rooms.push_back(connected);
    }
    return packet;
}

sf::Packet &operator<<(sf::Packet &packet, const DungeonDescriptor &dungeon) {
    packet << dungeon.level << dungeon.room_count << dungeon.spawn_x
           << dungeon.spawn_y;
    packet << static_cast<std::uint32_t>(dungeon.rooms.size());
    for (auto const &room : dungeon.rooms)
        packet << room;
    return packet;
}

sf::Packet &operator>>(sf::Packet &packet, DungeonDescriptor &dungeon) {
    packet >> dungeon.level >> dungeon.room_count >> dungeon.spawn_x >>
        dungeon.spawn_y;
    if (!packet)
        return packet;

    dungeon.rooms.clear();
    std::uint32_t count = ReadCount(packet);
    for (std::uint32_t i = 0; i < count; ++i) {
        RoomView room;
        if (!(packet >> room))
            throw CodecError("truncated room list");
        dungeon.rooms.push_back(std::move(room));
    }
    return packet;
}

sf::Packet &operator<<(sf::Packet &packet, const GameStateSnapshot &state) {
    WriteMap(packet, state.players);
    WriteMap(packet, state.enemies);
    WriteMap(packet, state.items);
    return packet << state.dungeon << state.level;
}

sf::Packet &operator>>(sf::Packet &packet, GameStateSnapshot &state) {
    ReadMap(packet, state.players);
    ReadMap(packet, state.enemies);
    ReadMap(packet, state.items);
    return packet >> state.dungeon >> state.level;
}

// Envelope

sf::Packet MessageCodec::Encode(const Message &message) {
    sf::Packet packet;
    packet << WIRE_SCHEMA_VERSION << std::string(message.GetTag())
           << message.GetTimestamp();
    std::visit([&packet](auto const &payload) { WritePayload(packet, payload); },
               message.GetPayload());
    return packet;
}

Message MessageCodec::Decode(sf::Packet &packet) {
    if (packet.getDataSize() == 0)
        throw CodecError("empty frame");
    if (packet.getDataSize() > MAX_FRAME_SIZE)
        throw CodecError("frame of " + std::to_string(packet.getDataSize()) +
                         " bytes exceeds limit");

    std::uint8_t version = 0;
    if (!(packet >> version))
        throw CodecError("truncated header");
    if (version != WIRE_SCHEMA_VERSION)
        throw CodecError("unsupported schema version " +
                         std::to_string(version));

    std::string tag;
    double timestamp = 0.0;
    if (!(packet >> tag >> timestamp))
        throw CodecError("truncated header");

    std::optional<MessageType> type = FromTag(tag);
    if (!type)
        throw CodecError("unknown message type '" + tag + "'");

    Payload payload = ReadPayloadOf(*type, packet);
    if (!packet)
        throw CodecError("truncated " + tag + " payload");
    if (!packet.endOfPacket())
        throw CodecError("trailing bytes after " + tag + " payload");

    return Message(std::move(payload), timestamp);
}

std::vector<std::uint8_t> MessageCodec::EncodeBytes(const Message &message) {
    sf::Packet packet = Encode(message);
    const auto *data = static_cast<const std::uint8_t *>(packet.getData());
    return std::vector<std::uint8_t>(data, data + packet.getDataSize());
}

Message MessageCodec::DecodeBytes(const void *data, std::size_t size) {
    sf::Packet packet;
    if (size > 0)
        packet.append(data, size);
    return Decode(packet);
}
