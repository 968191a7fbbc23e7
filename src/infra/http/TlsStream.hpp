#pragma once

#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/tcp_stream.hpp>

#include "infra/http/TlsHttpClient.hpp"

namespace infra::http {

using TlsTcpStream = boost::asio::ssl::stream<boost::beast::tcp_stream>;

// Client context verifying peers against endpoint.caFile, or the default
// verify paths when none is configured.
boost::asio::ssl::context makeTlsContext(const TlsEndpoint& endpoint);

// Resolves, connects and completes the TLS handshake, with hostname
// verification and SNI. Each step is bounded by endpoint.timeoutSec.
// Throws std::runtime_error prefixed with `what`.
void connectTls(boost::asio::io_context& ioc,
                TlsTcpStream& stream,
                const TlsEndpoint& endpoint,
                const std::string& what);

}  // namespace infra::http
