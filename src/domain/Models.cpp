#include "domain/Models.hpp"

namespace domain {

const char* toString(PaymentStatus status) noexcept {
    switch (status) {
    case PaymentStatus::Unknown:
        return "UNKNOWN";
    case PaymentStatus::InFlight:
        return "IN_FLIGHT";
    case PaymentStatus::Succeeded:
        return "SUCCEEDED";
    case PaymentStatus::Failed:
        return "FAILED";
    case PaymentStatus::Initiated:
        return "INITIATED";
    }
    return "UNKNOWN";
}

PaymentStatus paymentStatusFromString(const std::string& text) {
    if (text == "IN_FLIGHT") {
        return PaymentStatus::InFlight;
    }
    if (text == "SUCCEEDED") {
        return PaymentStatus::Succeeded;
    }
    if (text == "FAILED") {
        return PaymentStatus::Failed;
    }
    if (text == "INITIATED") {
        return PaymentStatus::Initiated;
    }
    return PaymentStatus::Unknown;
}

const char* toString(InvoiceState state) noexcept {
    switch (state) {
    case InvoiceState::Open:
        return "OPEN";
    case InvoiceState::Settled:
        return "SETTLED";
    case InvoiceState::Canceled:
        return "CANCELED";
    case InvoiceState::Accepted:
        return "ACCEPTED";
    }
    return "OPEN";
}

InvoiceState invoiceStateFromString(const std::string& text) {
    if (text == "SETTLED") {
        return InvoiceState::Settled;
    }
    if (text == "CANCELED") {
        return InvoiceState::Canceled;
    }
    if (text == "ACCEPTED") {
        return InvoiceState::Accepted;
    }
    return InvoiceState::Open;
}

}  // namespace domain
