#pragma once

#include <stdexcept>
#include <string>

// Host could not bind its listening port. Fatal for the host.
class BindError : public std::runtime_error {
public:
  explicit BindError(const std::string &what) : std::runtime_error(what) {}
};

// A single connection failed or was closed locally. Fatal for that session only.
class ConnectionError : public std::runtime_error {
public:
  explicit ConnectionError(const std::string &what)
      : std::runtime_error(what) {}
};

// A frame could not be decoded. The frame is dropped, the session survives.
class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string &what) : std::runtime_error(what) {}
};
