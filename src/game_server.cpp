#include "game_server.hpp"
#include <iostream>
#include <utility>

GameServer::GameServer(const server_config &config, GameStateSnapshot initial)
    : m_config(config), m_store(std::move(initial)),
      m_registry(m_config, m_store),
      m_router(m_store,
               [this](const Message &message) {
                   m_registry.Broadcast(message);
               }),
      m_broadcastLoop(
          m_store,
          [this](const Message &message) { m_registry.Broadcast(message); },
          m_config.tick_rate) {
    m_registry.SetMessageHandler(
        [this](uint32_t sender_id, const Message &message) {
            m_router.handle_message(sender_id, message);
        });
}

GameServer::~GameServer() { Stop(); }

void GameServer::Start() {
    m_registry.Listen();
    m_registry.Start();
    m_broadcastLoop.start();
    std::cout << "[GameServer] Server started on port " << GetPort()
              << std::endl;
}

void GameServer::Stop() {
    if (!m_registry.IsRunning() && !m_broadcastLoop.is_running())
        return;
    m_broadcastLoop.stop();
    m_registry.Stop();
    std::cout << "[GameServer] Server stopped" << std::endl;
}

void GameServer::UpdateGameState(const StateUpdate &update) {
    m_store.update_game_state(update);
}
