#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace lnt::sync {

enum class ErrorKind {
    Transient,
    UserCancelled,
    Fatal,
};

inline const char* toString(ErrorKind kind) noexcept {
    switch (kind) {
    case ErrorKind::Transient:
        return "transient";
    case ErrorKind::UserCancelled:
        return "user_cancelled";
    case ErrorKind::Fatal:
        return "fatal";
    }
    return "fatal";
}

// Failure reported by an upstream transport. `code` is backend specific
// (gRPC status codes for LND); 0 means the transport carried no status.
class TransportError : public std::runtime_error {
public:
    TransportError(int code, std::string details)
        : std::runtime_error("transport error (code " + std::to_string(code) + "): " + details),
          code_(code),
          details_(std::move(details)) {}

    int code() const noexcept { return code_; }
    const std::string& details() const noexcept { return details_; }

private:
    int code_;
    std::string details_;
};

// Raised when an upstream stream ends without an explicit error.
class StreamClosedError : public TransportError {
public:
    StreamClosedError() : TransportError(0, "stream closed unexpectedly") {}
};

class PeerAlreadyConnectedError : public TransportError {
public:
    using TransportError::TransportError;
};

class EdgeNotFoundError : public TransportError {
public:
    using TransportError::TransportError;
};

class UserCancelledError : public std::runtime_error {
public:
    explicit UserCancelledError(const std::string& what) : std::runtime_error(what) {}
};

class FatalError : public std::runtime_error {
public:
    explicit FatalError(const std::string& what) : std::runtime_error(what) {}
};

// A dispatcher gave up after exhausting its retry budget.
class DispatcherStoppedError : public FatalError {
public:
    explicit DispatcherStoppedError(const std::string& dispatcher)
        : FatalError("dispatcher '" + dispatcher + "' stopped permanently") {}
};

}  // namespace lnt::sync
