#pragma once

#include "packets.hpp"
#include <variant>

// Immutable message envelope. The type is derived from the payload, so a
// message can never carry a payload shape that does not match its tag.
class Message {
public:
  explicit Message(Payload payload);
  Message(Payload payload, double timestamp);

  MessageType GetType() const {
    return static_cast<MessageType>(m_payload.index());
  }
  const char *GetTag() const { return ToTag(GetType()); }
  const Payload &GetPayload() const { return m_payload; }
  double GetTimestamp() const { return m_timestamp; }

  template <typename T> const T &As() const { return std::get<T>(m_payload); }
  template <typename T> const T *TryAs() const {
    return std::get_if<T>(&m_payload);
  }

  // Wall clock, seconds since epoch
  static double Now();

private:
  Payload m_payload;
  double m_timestamp;
};

bool operator==(const Message &a, const Message &b);
inline bool operator!=(const Message &a, const Message &b) { return !(a == b); }
