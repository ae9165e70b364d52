#pragma once

#include "config.hpp"
#include "message.hpp"
#include "state_store.hpp"
#include "transport.hpp"
#include <SFML/Network/SocketSelector.hpp>
#include <SFML/Network/TcpListener.hpp>
#include <SFML/System/Time.hpp>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct Session {
  uint32_t id = 0;
  std::shared_ptr<Transport> transport;
  std::string address;
};

// Host side connection bookkeeping.
//
// A session is in the map exactly while its transport is open: Remove()
// erases the entry and closes the transport under the same lock, which also
// makes it idempotent. Player ids are handed out sequentially and never
// reused, even after a player leaves.
class SessionRegistry {
public:
  using MessageHandler = std::function<void(uint32_t, const Message &)>;

  SessionRegistry(const server_config &config, state_store &store);
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry &) = delete;
  SessionRegistry &operator=(const SessionRegistry &) = delete;

  // Binds the listening port. Throws BindError.
  void Listen();
  // Starts the accept worker
  void Start();
  // Closes the listener and every session, then joins all workers
  void Stop();
  bool IsRunning() const { return m_running; }

  uint16_t GetPort() const { return m_listener.getLocalPort(); }

  // Receives every decoded message with the sender's id. Set before Start().
  void SetMessageHandler(MessageHandler handler);

  // Waits up to the accept timeout for one connection. Returns nullptr on
  // timeout, failure, or when the server is full (the connection is closed
  // without an id being allocated).
  std::shared_ptr<Session> Accept();

  // Returns false if the id was not live
  bool Remove(uint32_t id);

  // Encodes once and sends to every live session except `exclude`. Each
  // session gets at most one tick period to take the frame; sessions that
  // fail or run out of time are removed after the loop.
  void Broadcast(const Message &message,
                 std::optional<uint32_t> exclude = std::nullopt);
  bool SendTo(uint32_t id, const Message &message);

  std::size_t Count() const;
  std::vector<uint32_t> LiveIds() const;
  // Receive workers not yet joined
  std::size_t WorkerCount() const;

private:
  void AcceptLoop();
  void ReapWorkers();
  void ReceiveLoop(std::shared_ptr<Session> session);

  server_config m_config;
  state_store &m_store;
  sf::Time m_broadcastBudget;

  sf::TcpListener m_listener;
  sf::SocketSelector m_listenSelector;
  std::atomic<bool> m_running{false};
  std::thread m_acceptThread;

  mutable std::mutex m_mutex;
  std::map<uint32_t, std::shared_ptr<Session>> m_sessions;
  uint32_t m_nextPlayerId = 0;

  MessageHandler m_handler;

  mutable std::mutex m_workersMutex;
  std::map<uint32_t, std::thread> m_workers;
  std::vector<uint32_t> m_finishedWorkers;
};
