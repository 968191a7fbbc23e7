#include <iostream>
#include <stdexcept>
#include <string>

#include "sync/ErrorClassifier.hpp"
#include "sync/Errors.hpp"

using lnt::sync::ErrorKind;

namespace {

// Treats code 16 as fatal, everything else as transient.
class StrictClassifier : public lnt::sync::ErrorClassifier {
protected:
    ErrorKind classify_transport(const lnt::sync::TransportError& error) const override {
        return error.code() == 16 ? ErrorKind::Fatal : ErrorKind::Transient;
    }
};

}  // namespace

int main() {
    const lnt::sync::DefaultErrorClassifier defaults;

    if (defaults.classify(lnt::sync::UserCancelledError("stop")) != ErrorKind::UserCancelled) {
        std::cerr << "UserCancelledError must classify as user_cancelled\n";
        return 1;
    }
    if (defaults.classify(lnt::sync::FatalError("bad")) != ErrorKind::Fatal ||
        defaults.classify(lnt::sync::DispatcherStoppedError("d")) != ErrorKind::Fatal) {
        std::cerr << "Fatal errors must classify as fatal\n";
        return 1;
    }
    if (defaults.classify(lnt::sync::TransportError(16, "unauthenticated")) != ErrorKind::Transient ||
        defaults.classify(std::runtime_error("disk full")) != ErrorKind::Transient) {
        std::cerr << "Default classifier should treat other failures as transient\n";
        return 1;
    }
    if (defaults.typed_error(lnt::sync::TransportError(2, "edge not found")) != nullptr) {
        std::cerr << "Default classifier has no typed errors\n";
        return 1;
    }

    const StrictClassifier strict;
    if (strict.classify(lnt::sync::TransportError(16, "unauthenticated")) != ErrorKind::Fatal) {
        std::cerr << "Transport classification hook was not used\n";
        return 1;
    }
    if (strict.classify(lnt::sync::StreamClosedError()) != ErrorKind::Transient) {
        std::cerr << "A closed stream is always transient\n";
        return 1;
    }
    if (std::string{lnt::sync::toString(ErrorKind::UserCancelled)} != "user_cancelled") {
        std::cerr << "Unexpected error kind name\n";
        return 1;
    }

    return 0;
}
