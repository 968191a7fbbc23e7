#pragma once

#include <exception>

#include "sync/Errors.hpp"

namespace lnt::sync {

// Decides how the engine reacts to a failure. Backends plug in their own
// transport classification; everything else is shared.
class ErrorClassifier {
public:
    virtual ~ErrorClassifier() = default;

    // UserCancelledError and FatalError keep their kind, StreamClosedError is
    // transient, other TransportErrors go through classify_transport() and any
    // remaining std::exception (persistence, parsing) is transient.
    ErrorKind classify(const std::exception& error) const;

    // Typed domain error carried by the transport error, or nullptr.
    virtual std::exception_ptr typed_error(const TransportError& error) const;

protected:
    virtual ErrorKind classify_transport(const TransportError& error) const = 0;
};

// Treats every transport failure as transient.
class DefaultErrorClassifier : public ErrorClassifier {
protected:
    ErrorKind classify_transport(const TransportError& error) const override;
};

}  // namespace lnt::sync
