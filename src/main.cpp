#include "client_mirror.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "game_server.hpp"
#include "message.hpp"
#include "packets.hpp"
#include "views/game_state.hpp"
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <SFML/System/Time.hpp>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

namespace {

constexpr unsigned int FPS = 60;
constexpr float STATUS_INTERVAL_SECONDS = 5.0f;

std::atomic<bool> g_running{true};

void handle_signal(int) { g_running = false; }

void print_usage(const char *program) {
    std::cerr << "Usage:\n"
              << "  " << program << " host [port]\n"
              << "  " << program << " join <address> [port]" << std::endl;
}

std::optional<uint16_t> parse_port(const std::string &text) {
    try {
        unsigned long value = std::stoul(text);
        if (value > 65535)
            return std::nullopt;
        return static_cast<uint16_t>(value);
    } catch (const std::exception &) {
        return std::nullopt;
    }
}

void register_callbacks(ClientMirror &client) {
    client.On<PlayerJoinedPacket>([](const PlayerJoinedPacket &packet) {
        std::cout << "Player " << packet.player_id << " joined" << std::endl;
    });
    client.On<PlayerLeftPacket>([](const PlayerLeftPacket &packet) {
        std::cout << "Player " << packet.player_id << " left" << std::endl;
    });
    client.On<PlayerAttackPacket>([](const PlayerAttackPacket &packet) {
        std::cout << "Player " << packet.player_id << " attacked" << std::endl;
    });
    client.On<EnemyDamagedPacket>([](const EnemyDamagedPacket &packet) {
        std::cout << "Enemy " << packet.enemy_id << " hit, " << packet.hp
                  << " hp left" << std::endl;
    });
    client.On<EnemyDiedPacket>([](const EnemyDiedPacket &packet) {
        std::cout << "Enemy " << packet.enemy_id << " died, "
                  << packet.drops.size() << " drops" << std::endl;
    });
    client.On<ItemPickedUpPacket>([](const ItemPickedUpPacket &packet) {
        std::cout << "Item " << packet.item_id << " picked up by player "
                  << packet.player_id << std::endl;
    });
}

// Stand-in for the game loop: keeps the local player's entry fresh on the
// host and reports what the mirror sees
int run_game_loop(ClientMirror &client) {
    if (!client.WaitForWelcome(sf::seconds(CONNECT_TIMEOUT_SECONDS))) {
        std::cerr << "No welcome from server" << std::endl;
        return 1;
    }
    const uint32_t player_id = *client.GetPlayerId();

    PlayerView local_player;
    local_player.player_id = player_id;
    local_player.name = "Player" + std::to_string(player_id);
    GameStateSnapshot state = client.GetSnapshot();
    local_player.x = state.dungeon.spawn_x;
    local_player.y = state.dungeon.spawn_y;

    const sf::Time frame_time = sf::seconds(1.0f / FPS);
    sf::Clock frame_clock;
    sf::Clock status_clock;

    while (g_running && client.IsConnected()) {
        frame_clock.restart();

        client.Send(Message(PlayerUpdatePacket{local_player}));

        if (status_clock.getElapsedTime().asSeconds() >=
            STATUS_INTERVAL_SECONDS) {
            state = client.GetSnapshot();
            std::cout << "Players: " << state.players.size()
                      << "  Enemies: " << state.enemies.size()
                      << "  Items: " << state.items.size()
                      << "  Level: " << state.level << std::endl;
            status_clock.restart();
        }

        sf::Time elapsed = frame_clock.getElapsedTime();
        if (elapsed < frame_time)
            sf::sleep(frame_time - elapsed);
    }

    return client.IsConnected() || !g_running ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const std::string mode = argv[1];
    std::string address = "127.0.0.1";
    uint16_t port = DEFAULT_PORT;

    int port_arg = 2;
    if (mode == "join") {
        if (argc < 3) {
            print_usage(argv[0]);
            return 1;
        }
        address = argv[2];
        port_arg = 3;
    } else if (mode != "host") {
        print_usage(argv[0]);
        return 1;
    }

    if (argc > port_arg) {
        std::optional<uint16_t> parsed = parse_port(argv[port_arg]);
        if (!parsed) {
            std::cerr << "Invalid port: " << argv[port_arg] << std::endl;
            return 1;
        }
        port = *parsed;
    }

    // The host also plays, through its own client over loopback
    std::unique_ptr<GameServer> server;
    if (mode == "host") {
        server_config config;
        config.port = port;
        server = std::make_unique<GameServer>(config);
        try {
            server->Start();
        } catch (const BindError &e) {
            std::cerr << "Failed to start server: " << e.what() << std::endl;
            return 1;
        }
    }

    ClientMirror client;
    register_callbacks(client);
    if (!client.Connect(address, port))
        return 1;

    int result = run_game_loop(client);

    client.Disconnect();
    if (server)
        server->Stop();
    return result;
}
