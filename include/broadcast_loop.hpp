#pragma once

#include "message.hpp"
#include "state_store.hpp"
#include <SFML/System/Time.hpp>
#include <atomic>
#include <functional>
#include <thread>

// Periodic full-state push. Each tick copies the snapshot under the store
// lock, then hands a game_state message to the broadcast sink outside it.
// A slow tick is not compensated by faster ones afterwards.
class broadcast_loop {
public:
  using broadcast_fn = std::function<void(const Message &)>;

  broadcast_loop(state_store &store, broadcast_fn broadcast,
                 unsigned int tick_rate);
  ~broadcast_loop();

  broadcast_loop(const broadcast_loop &) = delete;
  broadcast_loop &operator=(const broadcast_loop &) = delete;

  void start();
  void stop();
  bool is_running() const { return m_running; }

  // One tick's work, without the sleep
  void tick();

  sf::Time period() const { return m_period; }

private:
  void run();

  state_store &m_store;
  broadcast_fn m_broadcast;
  sf::Time m_period;
  std::atomic<bool> m_running{false};
  std::thread m_thread;
};
