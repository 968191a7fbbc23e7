#pragma once

#include <string>
#include <utility>
#include <vector>

namespace infra::http {

// Remote TLS peer. With an empty caFile the system trust store is used.
struct TlsEndpoint {
    std::string host;
    std::string port = "443";
    std::string caFile;
    int timeoutSec = 20;
};

enum class Method {
    Get,
    Post,
};

struct HttpsRequest {
    Method method = Method::Get;
    std::string target = "/";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    unsigned status = 0U;
    std::string body;
};

// Performs one HTTPS request over a fresh connection and returns the response
// whatever its status. Throws std::runtime_error on network or TLS errors.
HttpResponse https_request(const TlsEndpoint& endpoint, const HttpsRequest& request);

}  // namespace infra::http
