#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <boost/json.hpp>

#include "domain/lightning/ILightningNode.hpp"
#include "infra/http/TlsHttpClient.hpp"
#include "sync/ErrorClassifier.hpp"

namespace lnt::common {
struct Config;
}

namespace adapters::lnd {

struct LndConnection {
    std::string host = "127.0.0.1";
    std::uint16_t restPort = 8080;
    std::string tlsCertPath;
    std::string macaroonPath;
    int timeoutSec = 30;

    static LndConnection fromConfig(const lnt::common::Config& config);
};

// LND over its REST gateway. Unary calls are blocking HTTPS requests,
// subscriptions are websocket streams. Every failure surfaces as
// lnt::sync::TransportError (or the typed error the classifier extracts).
class LndRestClient : public domain::ILightningHistory, public domain::ILightningStreams {
public:
    LndRestClient(LndConnection connection, const lnt::sync::ErrorClassifier& classifier);

    domain::NodeInfo get_info() override;
    domain::PaymentsPage list_payments(const domain::PaymentsQuery& query) override;
    domain::InvoicesPage list_invoices(const domain::InvoicesQuery& query) override;
    domain::ForwardsPage forwarding_history(const domain::ForwardsQuery& query) override;

    std::unique_ptr<lnt::sync::UpstreamStream<domain::Payment>> track_payments() override;
    std::unique_ptr<lnt::sync::UpstreamStream<domain::Invoice>> subscribe_invoices() override;
    std::unique_ptr<lnt::sync::UpstreamStream<domain::HtlcEvent>> subscribe_htlc_events() override;
    std::unique_ptr<lnt::sync::UpstreamStream<domain::ChannelEvent>> subscribe_channel_events() override;
    std::unique_ptr<lnt::sync::UpstreamStream<domain::PeerEvent>> subscribe_peer_events() override;
    std::unique_ptr<lnt::sync::UpstreamStream<domain::OnchainTransaction>> subscribe_transactions() override;
    std::unique_ptr<lnt::sync::UpstreamStream<domain::GraphUpdate>> subscribe_channel_graph() override;

private:
    boost::json::value call_(const infra::http::HttpsRequest& request, const char* what);
    [[noreturn]] void raise_(int code, const std::string& message) const;
    infra::http::TlsEndpoint endpoint_() const;

    LndConnection connection_;
    const lnt::sync::ErrorClassifier& classifier_;
    std::string macaroonHex_;
};

}  // namespace adapters::lnd
