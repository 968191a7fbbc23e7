#include "adapters/lnd/LndWsStream.hpp"

#include <sys/socket.h>

#include <stdexcept>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "adapters/lnd/LndJson.hpp"
#include "sync/Errors.hpp"

namespace adapters::lnd {
namespace {

namespace beast = boost::beast;
namespace websocket = beast::websocket;

constexpr int kUnavailable = 14;

}  // namespace

LndWsStream::LndWsStream(const infra::http::TlsEndpoint& endpoint,
                         const std::string& target,
                         const std::string& macaroonHex,
                         const std::string& requestBody,
                         std::string name)
    : sslContext_(infra::http::makeTlsContext(endpoint)), ws_(ioc_, sslContext_), name_(std::move(name)) {
    try {
        infra::http::connectTls(ioc_, ws_.next_layer(), endpoint, name_);
    } catch (const std::runtime_error& ex) {
        throw lnt::sync::TransportError(kUnavailable, ex.what());
    }

    // The websocket layer owns the timeouts from here on; streams may be idle for hours.
    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([macaroonHex](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "lntrack/0.1");
        if (!macaroonHex.empty()) {
            req.set("Grpc-Metadata-macaroon", macaroonHex);
        }
    }));

    beast::error_code ec;
    ws_.handshake(endpoint.host + ":" + endpoint.port, target + "?method=GET", ec);
    if (ec) {
        throw lnt::sync::TransportError(kUnavailable, name_ + ": WebSocket handshake failed: " + ec.message());
    }

    ws_.text(true);
    ws_.write(boost::asio::buffer(requestBody), ec);
    if (ec) {
        throw lnt::sync::TransportError(kUnavailable, name_ + ": sending the request failed: " + ec.message());
    }
    LOG_DEBUG(name_ << ": websocket stream opened on " << target);
}

std::optional<boost::json::value> LndWsStream::read() {
    buffer_.clear();
    beast::error_code ec;
    ws_.read(buffer_, ec);
    if (ec == websocket::error::closed) {
        return std::nullopt;
    }
    if (ec) {
        if (cancelled_.load()) {
            throw lnt::sync::UserCancelledError(name_ + ": stream cancelled");
        }
        throw lnt::sync::TransportError(kUnavailable, name_ + ": read failed: " + ec.message());
    }

    auto frame = parseBody(beast::buffers_to_string(buffer_.cdata()), name_.c_str());
    if (auto error = gatewayError(frame)) {
        throw lnt::sync::TransportError(error->code, error->message);
    }
    if (!frame.is_object()) {
        throw std::runtime_error(name_ + ": unexpected websocket frame");
    }
    auto* result = frame.as_object().if_contains("result");
    if (result == nullptr) {
        throw std::runtime_error(name_ + ": websocket frame without result");
    }
    return std::move(*result);
}

void LndWsStream::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    // Wakes a read blocked on another thread; the descriptor stays owned by ws_.
    const auto fd = beast::get_lowest_layer(ws_).socket().native_handle();
    if (fd >= 0) {
        ::shutdown(fd, SHUT_RDWR);
    }
    LOG_DEBUG(name_ << ": websocket stream cancelled");
}

}  // namespace adapters::lnd
