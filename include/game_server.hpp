#pragma once

#include "broadcast_loop.hpp"
#include "config.hpp"
#include "message_router.hpp"
#include "session_registry.hpp"
#include "state_store.hpp"
#include "views/game_state.hpp"
#include <cstddef>
#include <cstdint>
#include <vector>

// Host context. Owns the store, the session registry, the router and the
// broadcast loop, and wires them together. One instance per hosted session.
class GameServer {
public:
  explicit GameServer(const server_config &config = server_config(),
                      GameStateSnapshot initial = GameStateSnapshot());
  ~GameServer();

  GameServer(const GameServer &) = delete;
  GameServer &operator=(const GameServer &) = delete;

  // Throws BindError
  void Start();
  void Stop();
  bool IsRunning() const { return m_registry.IsRunning(); }

  // Actual port, useful when the configured port was 0
  uint16_t GetPort() const { return m_registry.GetPort(); }

  // Folds external updates (world generation, AI, combat) into the snapshot
  void UpdateGameState(const StateUpdate &update);
  GameStateSnapshot GetSnapshot() const { return m_store.snapshot(); }

  std::size_t PlayerCount() const { return m_registry.Count(); }
  std::vector<uint32_t> LivePlayerIds() const { return m_registry.LiveIds(); }

  state_store &GetStore() { return m_store; }
  SessionRegistry &GetRegistry() { return m_registry; }

private:
  server_config m_config;
  state_store m_store;
  SessionRegistry m_registry;
  message_router m_router;
  broadcast_loop m_broadcastLoop;
};
