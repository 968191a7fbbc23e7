#include "infra/http/TlsHttpClient.hpp"

#include <chrono>
#include <sstream>
#include <stdexcept>
#include <string>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/rfc2818_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include "infra/http/TlsStream.hpp"

namespace infra::http {
namespace {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;

constexpr const char* kUserAgent = "lntrack/0.1";

const char* methodName(Method method) {
    return method == Method::Post ? "POST" : "GET";
}

std::runtime_error makeError(const TlsEndpoint& endpoint,
                             const HttpsRequest& request,
                             const std::string& message) {
    std::ostringstream oss;
    oss << "HTTPS " << methodName(request.method) << " request to https://" << endpoint.host << ':'
        << endpoint.port << request.target << " failed: " << message;
    return std::runtime_error(oss.str());
}

bool isIpAddress(const std::string& host) {
    boost::system::error_code ec;
    net::ip::make_address(host, ec);
    return !ec;
}

}  // namespace

ssl::context makeTlsContext(const TlsEndpoint& endpoint) {
    ssl::context context(ssl::context::tls_client);
    if (endpoint.caFile.empty()) {
        context.set_default_verify_paths();
    } else {
        boost::system::error_code ec;
        context.load_verify_file(endpoint.caFile, ec);
        if (ec) {
            throw std::runtime_error("Failed to load TLS certificate '" + endpoint.caFile + "': " + ec.message());
        }
    }
    context.set_verify_mode(ssl::verify_peer);
    return context;
}

void connectTls(net::io_context& ioc, TlsTcpStream& stream, const TlsEndpoint& endpoint, const std::string& what) {
    if (endpoint.timeoutSec <= 0) {
        throw std::runtime_error(what + ": timeout must be positive");
    }

    stream.set_verify_callback(ssl::rfc2818_verification(endpoint.host));

    // SNI only carries DNS names.
    if (!isIpAddress(endpoint.host) && !::SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        const unsigned long err = ::ERR_get_error();
        const char* reason = err != 0 ? ::ERR_reason_error_string(err) : nullptr;
        std::ostringstream oss;
        oss << what << ": failed to set SNI hostname to '" << endpoint.host << "'";
        if (reason != nullptr) {
            oss << ": " << reason;
        }
        throw std::runtime_error(oss.str());
    }

    net::ip::tcp::resolver resolver(ioc);
    beast::error_code ec;
    auto const results = resolver.resolve(endpoint.host, endpoint.port, ec);
    if (ec) {
        throw std::runtime_error(what + ": DNS resolution error: " + ec.message());
    }

    auto& lowestLayer = beast::get_lowest_layer(stream);
    lowestLayer.expires_after(std::chrono::seconds(endpoint.timeoutSec));
    lowestLayer.connect(results, ec);
    if (ec) {
        throw std::runtime_error(what + ": connection error: " + ec.message());
    }

    lowestLayer.expires_after(std::chrono::seconds(endpoint.timeoutSec));
    stream.handshake(ssl::stream_base::client, ec);
    if (ec) {
        throw std::runtime_error(what + ": TLS handshake error: " + ec.message());
    }
}

HttpResponse https_request(const TlsEndpoint& endpoint, const HttpsRequest& request) {
    if (endpoint.host.empty()) {
        throw std::runtime_error("HTTPS request requires a non-empty host");
    }

    net::io_context ioc;
    auto sslContext = makeTlsContext(endpoint);
    TlsTcpStream stream(ioc, sslContext);

    try {
        connectTls(ioc, stream, endpoint, "HTTPS");
    } catch (const std::runtime_error& ex) {
        throw makeError(endpoint, request, ex.what());
    }

    bhttp::request<bhttp::string_body> req{
        request.method == Method::Post ? bhttp::verb::post : bhttp::verb::get, request.target, 11};
    req.set(bhttp::field::host, endpoint.host);
    req.set(bhttp::field::user_agent, kUserAgent);
    req.set(bhttp::field::accept, "application/json");
    req.set(bhttp::field::connection, "close");
    for (const auto& [name, value] : request.headers) {
        req.set(name, value);
    }
    if (request.method == Method::Post) {
        req.set(bhttp::field::content_type, "application/json");
        req.body() = request.body;
    }
    req.prepare_payload();

    auto& lowestLayer = beast::get_lowest_layer(stream);
    beast::error_code ec;
    lowestLayer.expires_after(std::chrono::seconds(endpoint.timeoutSec));
    bhttp::write(stream, req, ec);
    if (ec) {
        throw makeError(endpoint, request, "Write error: " + ec.message());
    }

    beast::flat_buffer buffer;
    bhttp::response<bhttp::string_body> response;
    lowestLayer.expires_after(std::chrono::seconds(endpoint.timeoutSec));
    bhttp::read(stream, buffer, response, ec);
    if (ec) {
        throw makeError(endpoint, request, "Read error: " + ec.message());
    }

    stream.shutdown(ec);
    if (ec == net::error::eof) {
        ec = {};
    }
    if (ec == ssl::error::stream_truncated) {
        // Allow truncated TLS shutdown which may occur with some servers.
        ec = {};
    }
    if (ec) {
        throw makeError(endpoint, request, "TLS shutdown error: " + ec.message());
    }

    HttpResponse result;
    result.status = static_cast<unsigned>(response.result_int());
    result.body = std::move(response.body());
    return result;
}

}  // namespace infra::http
