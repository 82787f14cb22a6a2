#pragma once

#include <stdexcept>
#include <string>

// Every failure the session core raises derives from TightropeError so that
// I/O boundaries can log and keep going with a single catch.
class TightropeError : public std::runtime_error {
public:
  explicit TightropeError(const std::string& message)
    : std::runtime_error(message) {}
};

// Invalid chunk size, missing workspace root, bad setting values.
class ConfigError : public TightropeError {
public:
  explicit ConfigError(const std::string& message)
    : TightropeError("config: " + message) {}
};

// Relay or peer connection failure. Never retried.
class TransportError : public TightropeError {
public:
  explicit TransportError(const std::string& message)
    : TightropeError("transport: " + message) {}
};

// Malformed or unknown message, bad chunk index, undecodable payload.
class ProtocolError : public TightropeError {
public:
  explicit ProtocolError(const std::string& message)
    : TightropeError("protocol: " + message) {}
};

// File request that resolves outside the shared workspace.
class AuthorizationError : public TightropeError {
public:
  explicit AuthorizationError(const std::string& message)
    : TightropeError("authorization: " + message) {}
};

class TimeoutError : public TightropeError {
public:
  explicit TimeoutError(const std::string& message)
    : TightropeError("timeout: " + message) {}
};
