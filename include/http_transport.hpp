#pragma once

#include <boost/beast/core/string.hpp>
#include <boost/beast/http.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = boost::asio::ssl;

namespace pea {

struct HttpRequest {
    http::verb method = http::verb::post;
    std::string target;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    std::chrono::seconds timeout{10};

    std::string header(const std::string& name) const {
        for (const auto& h : headers) {
            if (beast::iequals(h.first, name)) return h.second;
        }
        return {};
    }
};

struct HttpResponse {
    unsigned status = 0;
    std::string body;

    bool ok() const { return status >= 200 && status < 300; }
};

// Request/response exchange with the message bus.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * Performs one exchange. Any HTTP status is returned as a response.
     * @throws TransportError on resolve/connect/TLS/IO failure or timeout.
     */
    virtual HttpResponse send(const HttpRequest& request) = 0;
};

struct BusEndpoint {
    bool tls = false;
    std::string host;
    std::string port;
    std::string base_path;

    // Parses "http[s]://host[:port][/prefix]". Throws std::invalid_argument.
    static BusEndpoint parse(const std::string& url);
};

// HTTP/1.1 client over Boost.Beast, one connection per request. Each stage
// (connect, handshake, write, read) is bounded by the request timeout.
class BeastHttpTransport : public HttpTransport {
public:
    explicit BeastHttpTransport(const std::string& base_url,
                                bool verify_peer = true,
                                std::string user_agent = "pea-agent");

    HttpResponse send(const HttpRequest& request) override;

    const BusEndpoint& endpoint() const { return endpoint_; }

private:
    BusEndpoint endpoint_;
    ssl::context ssl_ctx_;
    std::string user_agent_;

    http::request<http::string_body> build(const HttpRequest& request) const;
};

}
