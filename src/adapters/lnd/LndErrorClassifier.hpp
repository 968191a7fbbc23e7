#pragma once

#include <exception>

#include "sync/ErrorClassifier.hpp"

namespace adapters::lnd {

// gRPC status codes as carried by the REST gateway.
enum class GrpcCode : int {
    Ok = 0,
    Cancelled = 1,
    Unknown = 2,
    InvalidArgument = 3,
    DeadlineExceeded = 4,
    NotFound = 5,
    AlreadyExists = 6,
    PermissionDenied = 7,
    ResourceExhausted = 8,
    FailedPrecondition = 9,
    Aborted = 10,
    OutOfRange = 11,
    Unimplemented = 12,
    Internal = 13,
    Unavailable = 14,
    DataLoss = 15,
    Unauthenticated = 16,
};

class LndErrorClassifier : public lnt::sync::ErrorClassifier {
public:
    std::exception_ptr typed_error(const lnt::sync::TransportError& error) const override;

protected:
    lnt::sync::ErrorKind classify_transport(const lnt::sync::TransportError& error) const override;
};

}  // namespace adapters::lnd
