#pragma once

#include "config.hpp"
#include "message.hpp"
#include "packets.hpp"
#include "transport.hpp"
#include "views/game_state.hpp"
#include <SFML/System/Time.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

// Client side view of the host's world.
//
// A receive worker replaces the cached snapshot on welcome and game_state,
// then dispatches the message to the handlers registered for its type. The
// handlers run on the receive worker, outside the cache lock. The game loop
// reads the cache with GetSnapshot() once per frame.
//
// A handler that throws ends the receive worker the same way a transport
// error does: the mirror reports disconnected and never reconnects on its
// own.
class ClientMirror {
public:
  using Callback = std::function<void(const Message &)>;

  explicit ClientMirror(const client_config &config = client_config());
  ~ClientMirror();

  ClientMirror(const ClientMirror &) = delete;
  ClientMirror &operator=(const ClientMirror &) = delete;

  bool Connect(const std::string &host, uint16_t port = DEFAULT_PORT);
  void Disconnect();

  // Intents to the host. Returns false and marks the mirror disconnected if
  // the send fails. Call from the same thread as Connect/Disconnect.
  bool Send(const Message &message);

  void RegisterCallback(MessageType type, Callback callback);

  // Typed handler for the message type whose payload is T
  template <typename T> void On(std::function<void(const T &)> handler) {
    RegisterCallback(MessageTypeOf<T>(),
                     [handler = std::move(handler)](const Message &message) {
                       handler(message.As<T>());
                     });
  }

  // Copy of the cached snapshot
  GameStateSnapshot GetSnapshot() const;
  std::optional<uint32_t> GetPlayerId() const;
  bool IsConnected() const { return m_connected; }

  // Blocks until the welcome message has been processed
  bool WaitForWelcome(sf::Time timeout);

private:
  void ReceiveLoop();
  void ProcessMessage(const Message &message);

  client_config m_config;
  std::unique_ptr<Transport> m_transport;
  std::atomic<bool> m_connected{false};
  std::thread m_receiveThread;

  mutable std::mutex m_stateMutex;
  std::condition_variable m_welcomeCondition;
  GameStateSnapshot m_gameState;
  std::optional<uint32_t> m_playerId;

  std::mutex m_callbackMutex;
  std::map<MessageType, std::vector<Callback>> m_callbacks;
};
