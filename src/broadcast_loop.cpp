#include "broadcast_loop.hpp"
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

broadcast_loop::broadcast_loop(state_store &store, broadcast_fn broadcast,
                               unsigned int tick_rate)
    : m_store(store), m_broadcast(std::move(broadcast)),
      m_period(sf::seconds(1.0f / static_cast<float>(
                                      std::max(1u, tick_rate)))) {}

broadcast_loop::~broadcast_loop() { stop(); }

void broadcast_loop::start() {
    if (m_running.exchange(true))
        return;
    m_thread = std::thread(&broadcast_loop::run, this);
}

void broadcast_loop::stop() {
    m_running = false;
    if (m_thread.joinable())
        m_thread.join();
}

void broadcast_loop::tick() {
    GameStatePacket state;
    state.game_state = m_store.snapshot();
    m_broadcast(Message(std::move(state)));
}

void broadcast_loop::run() {
    sf::Clock clock;
    while (m_running) {
        clock.restart();
        try {
            tick();
        } catch (const std::runtime_error &e) {
            // One bad tick must not stop the updates
            std::cerr << "[broadcast_loop] Tick failed: " << e.what()
                      << std::endl;
        }

        sf::Time elapsed = clock.getElapsedTime();
        if (elapsed < m_period)
            sf::sleep(m_period - elapsed);
    }
}
