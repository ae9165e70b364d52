#include "client_mirror.hpp"
#include "errors.hpp"
#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

ClientMirror::ClientMirror(const client_config &config) : m_config(config) {}

ClientMirror::~ClientMirror() { Disconnect(); }

bool ClientMirror::Connect(const std::string &host, uint16_t port) {
    Disconnect();

    try {
        m_transport = Transport::Connect(host, port, m_config);
    } catch (const ConnectionError &e) {
        std::cerr << "[ClientMirror] Failed to connect: " << e.what()
                  << std::endl;
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_playerId.reset();
        m_gameState = GameStateSnapshot();
    }

    m_connected = true;
    m_receiveThread = std::thread(&ClientMirror::ReceiveLoop, this);

    std::cout << "[ClientMirror] Connected to server at " << host << ":"
              << port << std::endl;
    return true;
}

void ClientMirror::Disconnect() {
    bool was_connected = m_connected.exchange(false);
    if (m_transport)
        m_transport->Close();
    if (m_receiveThread.joinable())
        m_receiveThread.join();
    m_transport.reset();

    if (was_connected)
        std::cout << "[ClientMirror] Disconnected from server" << std::endl;
    m_welcomeCondition.notify_all();
}

bool ClientMirror::Send(const Message &message) {
    if (!m_connected || !m_transport)
        return false;

    try {
        m_transport->Send(message);
    } catch (const ConnectionError &e) {
        std::cerr << "[ClientMirror] Error sending message: " << e.what()
                  << std::endl;
        m_connected = false;
        m_transport->Close();
        return false;
    }
    return true;
}

void ClientMirror::RegisterCallback(MessageType type, Callback callback) {
    std::lock_guard<std::mutex> lock(m_callbackMutex);
    m_callbacks[type].push_back(std::move(callback));
}

GameStateSnapshot ClientMirror::GetSnapshot() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_gameState;
}

std::optional<uint32_t> ClientMirror::GetPlayerId() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_playerId;
}

bool ClientMirror::WaitForWelcome(sf::Time timeout) {
    std::unique_lock<std::mutex> lock(m_stateMutex);
    return m_welcomeCondition.wait_for(
        lock, std::chrono::microseconds(timeout.asMicroseconds()),
        [this] { return m_playerId.has_value() || !m_connected; }) &&
           m_playerId.has_value();
}

void ClientMirror::ReceiveLoop() {
    while (m_connected) {
        try {
            std::optional<Message> message = m_transport->Receive();
            if (!message)
                break;
            ProcessMessage(*message);
        } catch (const CodecError &e) {
            std::cerr << "[ClientMirror] Dropped malformed message: "
                      << e.what() << std::endl;
        } catch (const ConnectionError &e) {
            if (m_connected)
                std::cerr << "[ClientMirror] Error receiving message: "
                          << e.what() << std::endl;
            break;
        } catch (const std::exception &e) {
            // Thrown by a callback
            std::cerr << "[ClientMirror] Error handling message: " << e.what()
                      << std::endl;
            break;
        }
    }

    m_connected = false;
    {
        // Pairs with the predicate check in WaitForWelcome()
        std::lock_guard<std::mutex> lock(m_stateMutex);
    }
    m_welcomeCondition.notify_all();
}

void ClientMirror::ProcessMessage(const Message &message) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (const auto *welcome = message.TryAs<WelcomePacket>()) {
            m_playerId = welcome->player_id;
            m_gameState = welcome->game_state;
            std::cout << "[ClientMirror] Assigned player ID: "
                      << welcome->player_id << std::endl;
        } else if (const auto *state = message.TryAs<GameStatePacket>()) {
            m_gameState = state->game_state;
        }
    }
    if (message.GetType() == MessageType::Welcome)
        m_welcomeCondition.notify_all();

    std::vector<Callback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_callbackMutex);
        auto it = m_callbacks.find(message.GetType());
        if (it == m_callbacks.end())
            return;
        callbacks = it->second;
    }
    for (auto const &callback : callbacks)
        callback(message);
}
