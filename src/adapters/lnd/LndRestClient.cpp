#include "adapters/lnd/LndRestClient.hpp"

#include <chrono>
#include <exception>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include "adapters/lnd/LndJson.hpp"
#include "adapters/lnd/LndWsStream.hpp"
#include "common/Config.hpp"
#include "common/Log.hpp"
#include "common/Metrics.hpp"
#include "sync/Errors.hpp"

namespace adapters::lnd {
namespace {

constexpr int kUnknown = 2;
constexpr int kUnavailable = 14;

std::string readMacaroonHex(const std::string& path) {
    if (path.empty()) {
        return {};
    }
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("Failed to open macaroon file '" + path + "'");
    }
    const std::vector<unsigned char> bytes{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (const auto byte : bytes) {
        oss << std::setw(2) << static_cast<unsigned>(byte);
    }
    return oss.str();
}

// Used when the gateway answered with an error status but no error body.
int grpcCodeFromHttpStatus(unsigned status) {
    switch (status) {
    case 400U:
        return 3;  // INVALID_ARGUMENT
    case 401U:
        return 16;  // UNAUTHENTICATED
    case 403U:
        return 7;  // PERMISSION_DENIED
    case 404U:
        return 12;  // UNIMPLEMENTED
    case 429U:
        return 8;  // RESOURCE_EXHAUSTED
    case 502U:
    case 503U:
        return kUnavailable;
    case 504U:
        return 4;  // DEADLINE_EXCEEDED
    default:
        return kUnknown;
    }
}

std::int64_t nowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

LndConnection LndConnection::fromConfig(const lnt::common::Config& config) {
    LndConnection connection;
    connection.host = config.lndHost;
    connection.restPort = config.lndRestPort;
    connection.tlsCertPath = config.tlsCertPath;
    connection.macaroonPath = config.macaroonPath;
    connection.timeoutSec = static_cast<int>(config.httpTimeoutSec);
    return connection;
}

LndRestClient::LndRestClient(LndConnection connection, const lnt::sync::ErrorClassifier& classifier)
    : connection_(std::move(connection)),
      classifier_(classifier),
      macaroonHex_(readMacaroonHex(connection_.macaroonPath)) {
    if (macaroonHex_.empty()) {
        LOG_WARN("LndRestClient: no macaroon configured, requests are sent unauthenticated");
    }
}

domain::NodeInfo LndRestClient::get_info() {
    infra::http::HttpsRequest request;
    request.target = "/v1/getinfo";
    return nodeInfoFromJson(call_(request, "GetInfo"));
}

domain::PaymentsPage LndRestClient::list_payments(const domain::PaymentsQuery& query) {
    std::ostringstream target;
    target << "/v1/payments?index_offset=" << query.index_offset << "&max_payments=" << query.max_payments
           << "&include_incomplete=" << (query.include_incomplete ? "true" : "false");
    if (query.creation_date_start > 0) {
        target << "&creation_date_start=" << query.creation_date_start;
    }

    infra::http::HttpsRequest request;
    request.target = target.str();
    return paymentsPageFromJson(call_(request, "ListPayments"));
}

domain::InvoicesPage LndRestClient::list_invoices(const domain::InvoicesQuery& query) {
    std::ostringstream target;
    target << "/v1/invoices?index_offset=" << query.index_offset << "&num_max_invoices=" << query.num_max_invoices;
    if (query.creation_date_start > 0) {
        target << "&creation_date_start=" << query.creation_date_start;
    }

    infra::http::HttpsRequest request;
    request.target = target.str();
    return invoicesPageFromJson(call_(request, "ListInvoices"));
}

domain::ForwardsPage LndRestClient::forwarding_history(const domain::ForwardsQuery& query) {
    infra::http::HttpsRequest request;
    request.method = infra::http::Method::Post;
    request.target = "/v1/switch";
    request.body = forwardsRequestJson(query);
    return forwardsPageFromJson(call_(request, "ForwardingHistory"), query.index_offset);
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::Payment>> LndRestClient::track_payments() {
    auto stream = std::make_unique<LndWsStream>(
        endpoint_(), "/v2/router/payments", macaroonHex_, R"({"no_inflight_updates":false})", "TrackPayments");
    return std::make_unique<ParsedStream<domain::Payment>>(std::move(stream), paymentFromJson);
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::Invoice>> LndRestClient::subscribe_invoices() {
    auto stream =
        std::make_unique<LndWsStream>(endpoint_(), "/v1/invoices/subscribe", macaroonHex_, "{}", "SubscribeInvoices");
    return std::make_unique<ParsedStream<domain::Invoice>>(std::move(stream), invoiceFromJson);
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::HtlcEvent>> LndRestClient::subscribe_htlc_events() {
    auto stream =
        std::make_unique<LndWsStream>(endpoint_(), "/v2/router/htlcevents", macaroonHex_, "{}", "SubscribeHtlcEvents");
    return std::make_unique<ParsedStream<domain::HtlcEvent>>(std::move(stream), htlcEventFromJson);
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::ChannelEvent>> LndRestClient::subscribe_channel_events() {
    auto stream = std::make_unique<LndWsStream>(
        endpoint_(), "/v1/channels/subscribe", macaroonHex_, "{}", "SubscribeChannelEvents");
    return std::make_unique<ParsedStream<domain::ChannelEvent>>(
        std::move(stream), [](const boost::json::value& json) { return channelEventFromJson(json, nowMs()); });
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::PeerEvent>> LndRestClient::subscribe_peer_events() {
    auto stream = std::make_unique<LndWsStream>(
        endpoint_(), "/v1/peers/subscribe", macaroonHex_, "{}", "SubscribePeerEvents");
    return std::make_unique<ParsedStream<domain::PeerEvent>>(
        std::move(stream), [](const boost::json::value& json) { return peerEventFromJson(json, nowMs()); });
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::OnchainTransaction>> LndRestClient::subscribe_transactions() {
    auto stream = std::make_unique<LndWsStream>(
        endpoint_(), "/v1/transactions/subscribe", macaroonHex_, "{}", "SubscribeTransactions");
    return std::make_unique<ParsedStream<domain::OnchainTransaction>>(
        std::move(stream), [](const boost::json::value& json) { return transactionFromJson(json, nowMs()); });
}

std::unique_ptr<lnt::sync::UpstreamStream<domain::GraphUpdate>> LndRestClient::subscribe_channel_graph() {
    auto stream = std::make_unique<LndWsStream>(
        endpoint_(), "/v1/graph/subscribe", macaroonHex_, "{}", "SubscribeChannelGraph");
    return std::make_unique<ParsedStream<domain::GraphUpdate>>(
        std::move(stream), [](const boost::json::value& json) { return graphUpdateFromJson(json, nowMs()); });
}

boost::json::value LndRestClient::call_(const infra::http::HttpsRequest& request, const char* what) {
    auto withAuth = request;
    if (!macaroonHex_.empty()) {
        withAuth.headers.emplace_back("Grpc-Metadata-macaroon", macaroonHex_);
    }

    infra::http::HttpResponse response;
    {
        lnt::common::metrics::Registry::ScopedTimer timer(std::string{"lnd."} + what);
        try {
            response = infra::http::https_request(endpoint_(), withAuth);
        } catch (const std::runtime_error& ex) {
            raise_(kUnavailable, ex.what());
        }
    }

    if (response.status >= 400U) {
        LOG_DEBUG("LND " << what << " returned HTTP " << response.status << ": " << response.body);
        boost::json::error_code ec;
        const auto body = boost::json::parse(response.body, ec);
        if (!ec) {
            if (auto error = gatewayError(body)) {
                raise_(error->code, error->message);
            }
        }
        raise_(grpcCodeFromHttpStatus(response.status),
               std::string{what} + " failed with HTTP " + std::to_string(response.status));
    }
    return parseBody(response.body, what);
}

void LndRestClient::raise_(int code, const std::string& message) const {
    const lnt::sync::TransportError error(code, message);
    if (auto typed = classifier_.typed_error(error)) {
        std::rethrow_exception(typed);
    }
    throw error;
}

infra::http::TlsEndpoint LndRestClient::endpoint_() const {
    infra::http::TlsEndpoint endpoint;
    endpoint.host = connection_.host;
    endpoint.port = std::to_string(connection_.restPort);
    endpoint.caFile = connection_.tlsCertPath;
    endpoint.timeoutSec = connection_.timeoutSec;
    return endpoint;
}

}  // namespace adapters::lnd
