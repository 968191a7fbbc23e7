#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/websocket/stream.hpp>
#include <boost/json.hpp>

#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "infra/http/TlsStream.hpp"
#include "sync/UpstreamStream.hpp"

namespace adapters::lnd {

// Server-streaming RPC proxied over the gateway's websocket endpoint. The
// constructor connects and sends the request message; read() yields the
// "result" object of every frame.
class LndWsStream {
public:
    LndWsStream(const infra::http::TlsEndpoint& endpoint,
                const std::string& target,
                const std::string& macaroonHex,
                const std::string& requestBody,
                std::string name);

    LndWsStream(const LndWsStream&) = delete;
    LndWsStream& operator=(const LndWsStream&) = delete;

    // std::nullopt once the server closed the stream. Error frames and socket
    // failures throw lnt::sync::TransportError, a failure caused by cancel()
    // throws lnt::sync::UserCancelledError.
    std::optional<boost::json::value> read();

    // Unblocks a pending read() from any thread.
    void cancel();

    const std::string& name() const noexcept { return name_; }

private:
    boost::asio::io_context ioc_;
    boost::asio::ssl::context sslContext_;
    boost::beast::websocket::stream<infra::http::TlsTcpStream> ws_;
    boost::beast::flat_buffer buffer_;
    std::atomic<bool> cancelled_{false};
    std::string name_;
};

// Typed view of a websocket stream. Frames that fail to parse are skipped.
template <typename T>
class ParsedStream : public lnt::sync::UpstreamStream<T> {
public:
    using Parse = std::function<T(const boost::json::value&)>;

    ParsedStream(std::unique_ptr<LndWsStream> stream, Parse parse)
        : stream_(std::move(stream)), parse_(std::move(parse)) {}

    std::optional<T> read() override {
        for (;;) {
            auto frame = stream_->read();
            if (!frame) {
                return std::nullopt;
            }
            try {
                return parse_(*frame);
            } catch (const std::exception& ex) {
                lnt::common::metrics::Registry::instance().incrementCounter("conversion_errors_total");
                LOG_WARN(stream_->name() << ": skipping frame that failed to parse: " << ex.what());
            }
        }
    }

    void cancel() override { stream_->cancel(); }

private:
    std::unique_ptr<LndWsStream> stream_;
    Parse parse_;
};

}  // namespace adapters::lnd
