#pragma once

#include "message.hpp"
#include "views/game_state.hpp"
#include <SFML/Network/Packet.hpp>
#include <cstddef>
#include <cstdint>
#include <vector>

// Schema-driven message codec.
//
// Frame body layout:
//   [u8 schema version][string type tag][f64 timestamp][payload fields]
//
// Each type tag has one fixed payload layout. Strings and collections are
// length-prefixed with a u32, optionals carry a bool presence flag. When the
// packet is sent over a TcpSocket, SFML prepends the 4-byte big-endian body
// length, which gives the frame format of the wire protocol.
//
// Decoding throws CodecError instead of returning a partially filled message.
class MessageCodec {
public:
  static sf::Packet Encode(const Message &message);
  static Message Decode(sf::Packet &packet);

  // Raw body bytes, without the length prefix
  static std::vector<std::uint8_t> EncodeBytes(const Message &message);
  static Message DecodeBytes(const void *data, std::size_t size);
};

// Record level packet operators
sf::Packet &operator<<(sf::Packet &packet, const ItemDescriptor &item);
sf::Packet &operator>>(sf::Packet &packet, ItemDescriptor &item);
sf::Packet &operator<<(sf::Packet &packet, const PlayerView &player);
sf::Packet &operator>>(sf::Packet &packet, PlayerView &player);
sf::Packet &operator<<(sf::Packet &packet, const AttackData &attack);
sf::Packet &operator>>(sf::Packet &packet, AttackData &attack);
sf::Packet &operator<<(sf::Packet &packet, const EnemyView &enemy);
sf::Packet &operator>>(sf::Packet &packet, EnemyView &enemy);
sf::Packet &operator<<(sf::Packet &packet, const ItemView &item);
sf::Packet &operator>>(sf::Packet &packet, ItemView &item);
sf::Packet &operator<<(sf::Packet &packet, const RoomView &room);
sf::Packet &operator>>(sf::Packet &packet, RoomView &room);
sf::Packet &operator<<(sf::Packet &packet, const DungeonDescriptor &dungeon);
sf::Packet &operator>>(sf::Packet &packet, DungeonDescriptor &dungeon);
sf::Packet &operator<<(sf::Packet &packet, const GameStateSnapshot &state);
sf::Packet &operator>>(sf::Packet &packet, GameStateSnapshot &state);
