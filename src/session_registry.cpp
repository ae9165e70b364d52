#include "session_registry.hpp"
#include "errors.hpp"
#include "message_codec.hpp"
#include <algorithm>
#include <exception>
#include <iostream>
#include <string>
#include <utility>

SessionRegistry::SessionRegistry(const server_config &config,
                                 state_store &store)
    : m_config(config), m_store(store),
      m_broadcastBudget(sf::seconds(
          1.0f / static_cast<float>(std::max(1u, config.tick_rate)))) {}

SessionRegistry::~SessionRegistry() { Stop(); }

void SessionRegistry::Listen() {
    if (m_listener.listen(m_config.port) != sf::Socket::Status::Done) {
        throw BindError("failed to listen on port " +
                        std::to_string(m_config.port));
    }
    m_listenSelector.add(m_listener);
    m_running = true;
    std::cout << "[SessionRegistry] Listening on port " << GetPort()
              << std::endl;
}

void SessionRegistry::Start() {
    if (!m_running || m_acceptThread.joinable())
        return;
    m_acceptThread = std::thread(&SessionRegistry::AcceptLoop, this);
}

void SessionRegistry::Stop() {
    m_running = false;
    if (m_acceptThread.joinable())
        m_acceptThread.join();

    m_listenSelector.clear();
    m_listener.close();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto const &[id, session] : m_sessions)
            session->transport->Close();
        m_sessions.clear();
    }

    std::map<uint32_t, std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        workers.swap(m_workers);
        m_finishedWorkers.clear();
    }
    for (auto &[id, worker] : workers) {
        if (worker.joinable())
            worker.join();
    }
}

void SessionRegistry::SetMessageHandler(MessageHandler handler) {
    m_handler = std::move(handler);
}

void SessionRegistry::AcceptLoop() {
    while (m_running) {
        Accept();
        ReapWorkers();
    }
}

void SessionRegistry::ReapWorkers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        for (uint32_t id : m_finishedWorkers) {
            auto it = m_workers.find(id);
            if (it == m_workers.end())
                continue;
            finished.push_back(std::move(it->second));
            m_workers.erase(it);
        }
        m_finishedWorkers.clear();
    }
    for (auto &worker : finished) {
        if (worker.joinable())
            worker.join();
    }
}

std::size_t SessionRegistry::WorkerCount() const {
    std::lock_guard<std::mutex> lock(m_workersMutex);
    return m_workers.size();
}

std::shared_ptr<Session> SessionRegistry::Accept() {
    // Bounded wait so the accept worker notices Stop()
    if (!m_listenSelector.wait(m_config.accept_timeout))
        return nullptr;

    auto socket = std::make_unique<sf::TcpSocket>();
    if (m_listener.accept(*socket) != sf::Socket::Status::Done) {
        if (m_running)
            std::cerr << "[SessionRegistry] Error accepting connection"
                      << std::endl;
        return nullptr;
    }

    uint32_t id = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sessions.size() >= m_config.max_players) {
            std::cerr << "[SessionRegistry] Server full ("
                      << m_config.max_players << " players), rejecting "
                      << "connection" << std::endl;
            socket->disconnect();
            return nullptr;
        }
        id = m_nextPlayerId++;
    }

    auto session = std::make_shared<Session>();
    session->id = id;
    session->transport = std::make_shared<Transport>(
        std::move(socket), m_config.receive_timeout, m_config.send_timeout);
    session->address = session->transport->GetRemoteAddress();

    // Welcome goes out before the session is visible to Broadcast(), so the
    // new player never sees game_state ahead of its own id
    WelcomePacket welcome;
    welcome.player_id = id;
    welcome.game_state = m_store.snapshot();
    try {
        session->transport->Send(Message(std::move(welcome)));
    } catch (const ConnectionError &e) {
        std::cerr << "[SessionRegistry] Failed to welcome player " << id
                  << ": " << e.what() << std::endl;
        session->transport->Close();
        return nullptr;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sessions[id] = session;
    }

    PlayerJoinedPacket joined;
    joined.player_id = id;
    Broadcast(Message(joined), id);

    {
        std::lock_guard<std::mutex> lock(m_workersMutex);
        m_workers.emplace(
            id, std::thread(&SessionRegistry::ReceiveLoop, this, session));
    }

    std::cout << "[SessionRegistry] Player " << id << " connected from "
              << session->address << std::endl;
    return session;
}

void SessionRegistry::ReceiveLoop(std::shared_ptr<Session> session) {
    while (m_running) {
        try {
            std::optional<Message> message = session->transport->Receive();
            if (!message)
                break; // Peer closed the stream

            if (m_handler)
                m_handler(session->id, *message);
        } catch (const CodecError &e) {
            std::cerr << "[SessionRegistry] Dropped malformed frame from player "
                      << session->id << ": " << e.what() << std::endl;
        } catch (const ConnectionError &e) {
            if (m_running && session->transport->IsOpen())
                std::cerr << "[SessionRegistry] Connection to player "
                          << session->id << " lost: " << e.what()
                          << std::endl;
            break;
        } catch (const std::exception &e) {
            std::cerr << "[SessionRegistry] Error handling message from "
                      << "player " << session->id << ": " << e.what()
                      << std::endl;
            break;
        }
    }

    Remove(session->id);

    // Joined by the accept worker, or by Stop()
    std::lock_guard<std::mutex> lock(m_workersMutex);
    m_finishedWorkers.push_back(session->id);
}

bool SessionRegistry::Remove(uint32_t id) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end())
            return false;
        session = it->second;
        m_sessions.erase(it);
        session->transport->Close();
    }

    m_store.remove_player(id);
    std::cout << "[SessionRegistry] Player " << id << " disconnected"
              << std::endl;

    PlayerLeftPacket left;
    left.player_id = id;
    Broadcast(Message(left));
    return true;
}

void SessionRegistry::Broadcast(const Message &message,
                                std::optional<uint32_t> exclude) {
    sf::Packet packet = MessageCodec::Encode(message);

    std::vector<std::shared_ptr<Session>> targets;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        targets.reserve(m_sessions.size());
        for (auto const &[id, session] : m_sessions) {
            if (exclude && id == *exclude)
                continue;
            targets.push_back(session);
        }
    }

    std::vector<uint32_t> dead;
    for (auto const &session : targets) {
        try {
            session->transport->SendPacket(packet, m_broadcastBudget);
        } catch (const ConnectionError &e) {
            std::cerr << "[SessionRegistry] Failed to send '"
                      << message.GetTag() << "' to player " << session->id
                      << ": " << e.what() << std::endl;
            dead.push_back(session->id);
        }
    }

    for (uint32_t id : dead)
        Remove(id);
}

bool SessionRegistry::SendTo(uint32_t id, const Message &message) {
    std::shared_ptr<Session> session;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_sessions.find(id);
        if (it == m_sessions.end())
            return false;
        session = it->second;
    }

    try {
        session->transport->Send(message);
    } catch (const ConnectionError &e) {
        std::cerr << "[SessionRegistry] Failed to send '" << message.GetTag()
                  << "' to player " << id << ": " << e.what() << std::endl;
        Remove(id);
        return false;
    }
    return true;
}

std::size_t SessionRegistry::Count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sessions.size();
}

std::vector<uint32_t> SessionRegistry::LiveIds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<uint32_t> ids;
    ids.reserve(m_sessions.size());
    for (auto const &[id, session] : m_sessions)
        ids.push_back(id);
    return ids;
}
