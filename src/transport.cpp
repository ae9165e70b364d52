#include "transport.hpp"
#include "errors.hpp"
#include "message_codec.hpp"
#include <SFML/Network/IpAddress.hpp>
#include <SFML/System/Clock.hpp>
#include <SFML/System/Sleep.hpp>
#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace {

// Back-off while the kernel send buffer is full
const sf::Time SEND_RETRY_INTERVAL = sf::milliseconds(1);

std::string DescribePeer(const sf::TcpSocket &socket) {
    std::optional<sf::IpAddress> address = socket.getRemoteAddress();
    if (!address)
        return "<unknown>";
    return address->toString() + ":" + std::to_string(socket.getRemotePort());
}

} // namespace

Transport::Transport(std::unique_ptr<sf::TcpSocket> socket,
                     sf::Time receiveTimeout, sf::Time sendTimeout)
    : m_socket(std::move(socket)), m_receiveTimeout(receiveTimeout),
      m_sendTimeout(sendTimeout) {
    m_remoteAddress = DescribePeer(*m_socket);
    m_socket->setBlocking(false);
    m_selector.add(*m_socket);
}

Transport::~Transport() {
    Close();
    m_selector.clear();
    m_socket->disconnect();
}

std::unique_ptr<Transport> Transport::Connect(const std::string &host,
                                              uint16_t port,
                                              const client_config &config) {
    std::optional<sf::IpAddress> address = sf::IpAddress::resolve(host);
    if (!address)
        throw ConnectionError("cannot resolve host " + host);

    auto socket = std::make_unique<sf::TcpSocket>();
    if (socket->connect(*address, port, config.connect_timeout) !=
        sf::Socket::Status::Done) {
        throw ConnectionError("cannot connect to " + host + ":" +
                              std::to_string(port));
    }

    return std::make_unique<Transport>(std::move(socket),
                                       config.receive_timeout,
                                       config.send_timeout);
}

void Transport::Send(const Message &message) {
    SendPacket(MessageCodec::Encode(message), m_sendTimeout);
}

void Transport::SendPacket(const sf::Packet &packet, sf::Time budget) {
    // sf::Packet tracks how much of itself was sent, so each send needs its
    // own copy
    sf::Packet frame = packet;

    sf::Clock clock;
    std::unique_lock<std::timed_mutex> lock(
        m_sendMutex, std::chrono::microseconds(budget.asMicroseconds()));
    if (!lock.owns_lock())
        throw ConnectionError("send to " + m_remoteAddress +
                              " blocked behind another send");

    while (true) {
        if (m_closed)
            throw ConnectionError("send on closed transport to " +
                                  m_remoteAddress);

        switch (m_socket->send(frame)) {
        case sf::Socket::Status::Done:
            return;
        case sf::Socket::Status::Partial:
        case sf::Socket::Status::NotReady:
            // A frame cut short here leaves the stream unusable, so the
            // caller must drop the connection on this error
            if (clock.getElapsedTime() > budget)
                throw ConnectionError("send to " + m_remoteAddress +
                                      " timed out");
            sf::sleep(SEND_RETRY_INTERVAL);
            break;
        case sf::Socket::Status::Disconnected:
            throw ConnectionError("peer " + m_remoteAddress +
                                  " disconnected");
        case sf::Socket::Status::Error:
        default:
            throw ConnectionError("send to " + m_remoteAddress + " failed");
        }
    }
}

std::optional<Message> Transport::Receive() {
    while (true) {
        if (m_closed)
            throw ConnectionError("receive on closed transport from " +
                                  m_remoteAddress);

        // Timeout: keep waiting
        if (!m_selector.wait(m_receiveTimeout))
            continue;

        const bool readingHeader = m_headerReceived < m_header.size();
        void *target = readingHeader ? static_cast<void *>(m_header.data() +
                                                           m_headerReceived)
                                     : static_cast<void *>(m_body.data() +
                                                           m_bodyReceived);
        const std::size_t wanted =
            readingHeader ? m_header.size() - m_headerReceived
                          : m_body.size() - m_bodyReceived;

        std::size_t received = 0;
        switch (m_socket->receive(target, wanted, received)) {
        case sf::Socket::Status::Done:
        case sf::Socket::Status::Partial:
            break;
        case sf::Socket::Status::NotReady:
            continue;
        case sf::Socket::Status::Disconnected:
            return std::nullopt;
        case sf::Socket::Status::Error:
        default:
            throw ConnectionError("receive from " + m_remoteAddress +
                                  " failed");
        }

        if (readingHeader) {
            m_headerReceived += received;
            if (m_headerReceived < m_header.size())
                continue;

            const std::uint32_t length =
                (std::uint32_t(m_header[0]) << 24) |
                (std::uint32_t(m_header[1]) << 16) |
                (std::uint32_t(m_header[2]) << 8) | std::uint32_t(m_header[3]);
            // Checked before any of the body is buffered. The rest of the
            // stream cannot be resynchronized, so this ends the connection.
            if (length > MAX_FRAME_SIZE)
                throw ConnectionError("frame of " + std::to_string(length) +
                                      " bytes from " + m_remoteAddress +
                                      " exceeds the size limit");
            m_body.assign(length, 0);
            m_bodyReceived = 0;
        } else {
            m_bodyReceived += received;
        }

        if (m_bodyReceived < m_body.size())
            continue;

        std::vector<std::uint8_t> body;
        body.swap(m_body);
        m_headerReceived = 0;
        m_bodyReceived = 0;
        return MessageCodec::DecodeBytes(body.data(), body.size());
    }
}

void Transport::Close() { m_closed = true; }
