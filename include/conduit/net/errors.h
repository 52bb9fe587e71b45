#pragma once
#include <stdexcept>
#include <string>

namespace conduit::net {

// Base of every fault the library reports. Catch the derived types to tell
// a refused connection from a stalled one.
class NetError : public std::runtime_error {
public:
    explicit NetError(const std::string& message) : std::runtime_error(message) {}
};

// Name resolution failed, or no resolved address accepted the connection.
class ConnectError : public NetError {
public:
    explicit ConnectError(const std::string& message) : NetError(message) {}
};

// Send or receive failed on an established connection.
class NetworkException : public NetError {
public:
    explicit NetworkException(const std::string& message) : NetError(message) {}
};

// A single blocking I/O call exceeded the configured timeout.
class TimeoutException : public NetError {
public:
    explicit TimeoutException(const std::string& message) : NetError(message) {}
};

// Malformed chunked framing or a corrupt compressed payload.
class DecodingException : public NetError {
public:
    explicit DecodingException(const std::string& message) : NetError(message) {}
};

// Protocol-level policy violation: oversized headers or body, an operation
// the scheme cannot carry, an unusable URI.
class RequestException : public NetError {
public:
    explicit RequestException(const std::string& message) : NetError(message) {}
};

} // namespace conduit::net
