#include "sync/ErrorClassifier.hpp"

namespace lnt::sync {

ErrorKind ErrorClassifier::classify(const std::exception& error) const {
    if (dynamic_cast<const UserCancelledError*>(&error) != nullptr) {
        return ErrorKind::UserCancelled;
    }
    if (dynamic_cast<const FatalError*>(&error) != nullptr) {
        return ErrorKind::Fatal;
    }
    if (dynamic_cast<const StreamClosedError*>(&error) != nullptr) {
        return ErrorKind::Transient;
    }
    if (const auto* transport = dynamic_cast<const TransportError*>(&error)) {
        return classify_transport(*transport);
    }
    return ErrorKind::Transient;
}

std::exception_ptr ErrorClassifier::typed_error(const TransportError&) const { return nullptr; }

ErrorKind DefaultErrorClassifier::classify_transport(const TransportError&) const {
    return ErrorKind::Transient;
}

}  // namespace lnt::sync
