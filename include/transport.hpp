#pragma once

#include "config.hpp"
#include "message.hpp"
#include <SFML/Network/Packet.hpp>
#include <SFML/Network/SocketSelector.hpp>
#include <SFML/Network/TcpSocket.hpp>
#include <SFML/System/Time.hpp>
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// One reliable, ordered connection carrying framed messages.
//
// The socket runs non-blocking underneath: Receive() parks on a selector for
// at most one receive timeout at a time, so Close() from another thread is
// observed by a blocked receiver within one timeout interval. Frames are
// reassembled here, never decoded before the last byte arrives, and a length
// prefix above MAX_FRAME_SIZE fails the connection before any body is read.
//
// Close() only marks the transport closed. The socket itself is released by
// the destructor, which on the host runs once the session's receive worker
// has exited (within one receive timeout of the close).
//
// Send() may be called from several threads; frames never interleave.
// Receive() must only be called from one thread.
class Transport {
public:
  Transport(std::unique_ptr<sf::TcpSocket> socket, sf::Time receiveTimeout,
            sf::Time sendTimeout);
  ~Transport();

  Transport(const Transport &) = delete;
  Transport &operator=(const Transport &) = delete;

  // Throws ConnectionError if the host cannot be resolved or reached
  static std::unique_ptr<Transport> Connect(const std::string &host,
                                            uint16_t port,
                                            const client_config &config);

  // Throws ConnectionError. Send() waits up to the send timeout.
  void Send(const Message &message);
  // Gives up after `budget`, counting the wait for a concurrent send. A
  // timeout may leave a partial frame on the wire, so the transport must be
  // dropped after any ConnectionError.
  void SendPacket(const sf::Packet &packet, sf::Time budget);

  // Blocks until a full frame arrives. Returns nullopt when the peer closed
  // the stream. Throws ConnectionError on socket failure or local close, and
  // CodecError when the frame cannot be decoded (the stream stays usable).
  std::optional<Message> Receive();

  // Idempotent. Blocked and future Send/Receive calls fail afterwards.
  void Close();
  bool IsOpen() const { return !m_closed; }

  const std::string &GetRemoteAddress() const { return m_remoteAddress; }

private:
  std::unique_ptr<sf::TcpSocket> m_socket;
  sf::SocketSelector m_selector;
  sf::Time m_receiveTimeout;
  sf::Time m_sendTimeout;
  std::atomic<bool> m_closed{false};
  std::timed_mutex m_sendMutex;
  std::string m_remoteAddress;

  // Frame being reassembled by Receive()
  std::array<std::uint8_t, 4> m_header{};
  std::size_t m_headerReceived = 0;
  std::vector<std::uint8_t> m_body;
  std::size_t m_bodyReceived = 0;
};
