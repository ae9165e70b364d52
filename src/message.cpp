#include "message.hpp"
#include <chrono>
#include <utility>

Message::Message(Payload payload)
    : m_payload(std::move(payload)), m_timestamp(Now()) {}

Message::Message(Payload payload, double timestamp)
    : m_payload(std::move(payload)), m_timestamp(timestamp) {}

double Message::Now() {
    using namespace std::chrono;
    return duration_cast<duration<double>>(
               system_clock::now().time_since_epoch())
        .count();
}

bool operator==(const Message &a, const Message &b) {
    return a.GetType() == b.GetType() && a.GetPayload() == b.GetPayload() &&
           a.GetTimestamp() == b.GetTimestamp();
}
