#include "adapters/lnd/LndErrorClassifier.hpp"

#include <string>

namespace adapters::lnd {

using lnt::sync::ErrorKind;

std::exception_ptr LndErrorClassifier::typed_error(const lnt::sync::TransportError& error) const {
    const auto& details = error.details();
    if (details.find("already connected to peer") != std::string::npos) {
        return std::make_exception_ptr(lnt::sync::PeerAlreadyConnectedError(error.code(), details));
    }
    if (details.find("edge not found") != std::string::npos) {
        return std::make_exception_ptr(lnt::sync::EdgeNotFoundError(error.code(), details));
    }
    return nullptr;
}

ErrorKind LndErrorClassifier::classify_transport(const lnt::sync::TransportError& error) const {
    switch (static_cast<GrpcCode>(error.code())) {
    case GrpcCode::Cancelled:
        return ErrorKind::UserCancelled;
    case GrpcCode::Ok:
    case GrpcCode::Unknown:
    case GrpcCode::DeadlineExceeded:
    case GrpcCode::ResourceExhausted:
    case GrpcCode::Aborted:
    case GrpcCode::Internal:
    case GrpcCode::Unavailable:
        return ErrorKind::Transient;
    case GrpcCode::InvalidArgument:
    case GrpcCode::NotFound:
    case GrpcCode::PermissionDenied:
    case GrpcCode::FailedPrecondition:
    case GrpcCode::Unimplemented:
    case GrpcCode::Unauthenticated:
        return ErrorKind::Fatal;
    default:
        break;
    }
    return ErrorKind::Fatal;
}

}  // namespace adapters::lnd
