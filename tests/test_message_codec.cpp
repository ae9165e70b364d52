#include "doctest/doctest.h"
#include "errors.hpp"
#include "message.hpp"
#include "message_codec.hpp"
#include "test_helpers.hpp"
#include <SFML/Network/Packet.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace {

GameStateSnapshot sample_state() {
    GameStateSnapshot state;

    PlayerView player = make_player(0, 120.5f, -40.0f);
    player.facing_angle = 1.5f;
    player.is_blocking = true;
    player.equipped["weapon"] = ItemDescriptor{"weapon", "sword", "Sword"};
    player.equipped["shield"] = std::nullopt;
    state.players[0] = player;

    EnemyView enemy = make_enemy(7, 60.0f);
    enemy.target = 0u;
    enemy.room_id = 3;
    enemy.has_bow = true;
    state.enemies[7] = enemy;
    state.enemies[8] = make_enemy(8, 30.0f);

    state.items[2] = make_item(2, "hammer");

    RoomView room;
    room.room_id = 3;
    room.width = 500.0f;
    room.height = 420.0f;
    room.connected_rooms = {1, 4};
    state.dungeon.rooms.push_back(room);
    state.dungeon.room_count = 1;
    state.dungeon.spawn_x = 250.0f;
    state.level = 2;
    return state;
}

Message round_trip(const Message &message) {
    std::vector<std::uint8_t> bytes = MessageCodec::EncodeBytes(message);
    return MessageCodec::DecodeBytes(bytes.data(), bytes.size());
}

} // namespace

TEST_SUITE("message_codec") {

TEST_CASE("every message kind survives a round trip") {
    AttackData swing{30.0f, 50.0f, 0.75f, 10.0f, 20.0f};

    std::vector<Message> messages = {
        Message(WelcomePacket{3, sample_state()}, 1700000000.25),
        Message(PlayerJoinedPacket{4}),
        Message(PlayerLeftPacket{4}),
        Message(PlayerUpdatePacket{make_player(1, 5.0f, 6.0f)}),
        Message(AttackPacket{swing}),
        Message(PlayerAttackPacket{1, swing}),
        Message(EnemyDamagePacket{7, 60.0f, {"sword", "daggers"}}),
        Message(EnemyDamagedPacket{7, 40.0f}),
        Message(EnemyDiedPacket{7, {"sword"}}),
        Message(PickupItemPacket{2}),
        Message(ItemPickedUpPacket{2, 1}),
        Message(GameStatePacket{sample_state()}),
    };
    REQUIRE(messages.size() == MESSAGE_TYPE_COUNT);

    for (auto const &message : messages) {
        CAPTURE(message.GetTag());
        Message decoded = round_trip(message);
        CHECK(decoded.GetType() == message.GetType());
        CHECK(decoded == message);
    }
}

TEST_CASE("tags map to types and back") {
    for (std::size_t i = 0; i < MESSAGE_TYPE_COUNT; ++i) {
        auto type = static_cast<MessageType>(i);
        auto parsed = FromTag(ToTag(type));
        REQUIRE(parsed.has_value());
        CHECK(*parsed == type);
    }
    CHECK(std::string(ToTag(MessageType::ItemPickedUp)) == "item_picked_up");
    CHECK(MessageTypeOf<EnemyDiedPacket>() == MessageType::EnemyDied);
    CHECK_FALSE(FromTag("teleport").has_value());
}

TEST_CASE("truncated frames never decode") {
    std::vector<std::uint8_t> bytes =
        MessageCodec::EncodeBytes(Message(WelcomePacket{0, sample_state()}));

    for (std::size_t length = 0; length < bytes.size(); ++length) {
        CAPTURE(length);
        CHECK_THROWS_AS(MessageCodec::DecodeBytes(bytes.data(), length),
                        CodecError);
    }
}

TEST_CASE("trailing bytes are rejected") {
    std::vector<std::uint8_t> bytes =
        MessageCodec::EncodeBytes(Message(PickupItemPacket{9}));
    bytes.push_back(0x42);
    CHECK_THROWS_AS(MessageCodec::DecodeBytes(bytes.data(), bytes.size()),
                    CodecError);
}

TEST_CASE("unknown tag and schema version are rejected") {
    sf::Packet unknown;
    unknown << WIRE_SCHEMA_VERSION << std::string("teleport") << 0.0
            << std::uint32_t(1);
    CHECK_THROWS_AS(MessageCodec::Decode(unknown), CodecError);

    sf::Packet future;
    future << std::uint8_t(WIRE_SCHEMA_VERSION + 1)
           << std::string("pickup_item") << 0.0 << std::uint32_t(1);
    CHECK_THROWS_AS(MessageCodec::Decode(future), CodecError);
}

TEST_CASE("oversized collection counts are rejected") {
    sf::Packet packet;
    packet << WIRE_SCHEMA_VERSION << std::string("enemy_died") << 0.0
           << std::uint32_t(7) << std::uint32_t(1000000);
    CHECK_THROWS_AS(MessageCodec::Decode(packet), CodecError);
}

TEST_CASE("duplicate ids in a snapshot are rejected") {
    sf::Packet packet;
    packet << WIRE_SCHEMA_VERSION << std::string("game_state") << 0.0;
    packet << std::uint32_t(0);                          // players
    packet << std::uint32_t(2);                          // enemies
    packet << std::uint32_t(7) << make_enemy(7, 60.0f);
    packet << std::uint32_t(7) << make_enemy(7, 30.0f);
    packet << std::uint32_t(0);                          // items
    packet << DungeonDescriptor() << std::int32_t(1);
    CHECK_THROWS_AS(MessageCodec::Decode(packet), CodecError);
}

TEST_CASE("payload shape is fixed by the message type") {
    Message message(EnemyDamagePacket{7, 20.0f, {}});
    CHECK(message.GetType() == MessageType::EnemyDamage);
    CHECK(message.TryAs<EnemyDamagePacket>() != nullptr);
    CHECK(message.TryAs<EnemyDiedPacket>() == nullptr);
    CHECK(message.GetTimestamp() > 0.0);
}

}
