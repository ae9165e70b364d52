#pragma once

#include <SFML/System/Time.hpp>
#include <cstddef>
#include <cstdint>

// Network defaults
constexpr std::uint16_t DEFAULT_PORT = 5555;
constexpr std::size_t MAX_PLAYERS = 4;
constexpr unsigned int NETWORK_TICK_RATE = 30; // Broadcasts per second

constexpr float ACCEPT_TIMEOUT_SECONDS = 1.0f;
// Longest a blocked receiver waits before noticing a local Close()
constexpr float RECEIVE_TIMEOUT_SECONDS = 0.25f;
constexpr float SEND_TIMEOUT_SECONDS = 5.0f;
constexpr float CONNECT_TIMEOUT_SECONDS = 5.0f;

// Frames larger than this are treated as malformed
constexpr std::size_t MAX_FRAME_SIZE = 1024 * 1024;

constexpr std::uint8_t WIRE_SCHEMA_VERSION = 1;

struct server_config {
    std::uint16_t port = DEFAULT_PORT;
    std::size_t max_players = MAX_PLAYERS;
    unsigned int tick_rate = NETWORK_TICK_RATE;
    sf::Time accept_timeout = sf::seconds(ACCEPT_TIMEOUT_SECONDS);
    sf::Time receive_timeout = sf::seconds(RECEIVE_TIMEOUT_SECONDS);
    sf::Time send_timeout = sf::seconds(SEND_TIMEOUT_SECONDS);
};

struct client_config {
    sf::Time connect_timeout = sf::seconds(CONNECT_TIMEOUT_SECONDS);
    sf::Time receive_timeout = sf::seconds(RECEIVE_TIMEOUT_SECONDS);
    sf::Time send_timeout = sf::seconds(SEND_TIMEOUT_SECONDS);
};
