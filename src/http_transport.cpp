#include "http_transport.hpp"
#include "errors.hpp"
#include "agent_logger.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace pea {

namespace {

struct Exchange {
    http::request<http::string_body> req;
    http::response<http::string_body> res;
    beast::flat_buffer buffer;
    beast::error_code ec;
    std::string stage;
};

// Runs resolve -> connect -> [handshake] -> write -> read on a private
// io_context, renewing the stream deadline before each stage.
template <class Stream>
void run_exchange(net::io_context& ioc, Stream& stream, const BusEndpoint& ep,
                  Exchange& ex, std::chrono::seconds timeout) {
    constexpr bool is_tls = std::is_same<Stream, beast::ssl_stream<beast::tcp_stream>>::value;

    tcp::resolver resolver(ioc);
    auto& lowest = beast::get_lowest_layer(stream);

    auto fail = [&ex](beast::error_code ec, const char* stage) {
        ex.ec = ec;
        ex.stage = stage;
    };

    auto on_read = [&](beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "read");
    };

    auto on_write = [&](beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");
        lowest.expires_after(timeout);
        http::async_read(stream, ex.buffer, ex.res, on_read);
    };

    auto do_write = [&]() {
        lowest.expires_after(timeout);
        http::async_write(stream, ex.req, on_write);
    };

    auto on_handshake = [&](beast::error_code ec) {
        if (ec) return fail(ec, "tls handshake");
        do_write();
    };

    auto on_connect = [&](beast::error_code ec, tcp::endpoint) {
        if (ec) return fail(ec, "connect");
        if constexpr (is_tls) {
            lowest.expires_after(timeout);
            stream.async_handshake(ssl::stream_base::client, on_handshake);
        } else {
            do_write();
        }
    };

    auto on_resolve = [&](beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail(ec, "resolve");
        lowest.expires_after(timeout);
        lowest.async_connect(results, on_connect);
    };

    resolver.async_resolve(ep.host, ep.port, on_resolve);
    ioc.run();

    beast::error_code ignored;
    lowest.socket().shutdown(tcp::socket::shutdown_both, ignored);
}

}

BusEndpoint BusEndpoint::parse(const std::string& url) {
    BusEndpoint ep;
    std::string rest;

    if (url.rfind("https://", 0) == 0) {
        ep.tls = true;
        rest = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        rest = url.substr(7);
    } else {
        throw std::invalid_argument("bus URL must start with http:// or https://: " + url);
    }

    auto slash = rest.find('/');
    std::string authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        ep.base_path = rest.substr(slash);
        while (!ep.base_path.empty() && ep.base_path.back() == '/') ep.base_path.pop_back();
    }

    auto colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos) {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    } else {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }

    if (ep.host.empty() || ep.port.empty()) {
        throw std::invalid_argument("bus URL has no host: " + url);
    }
    return ep;
}

BeastHttpTransport::BeastHttpTransport(const std::string& base_url, bool verify_peer, std::string user_agent)
    : endpoint_(BusEndpoint::parse(base_url))
    , ssl_ctx_(ssl::context::tls_client)
    , user_agent_(std::move(user_agent))
{
    if (endpoint_.tls) {
        ssl_ctx_.set_options(ssl::context::default_workarounds |
                             ssl::context::no_sslv2 |
                             ssl::context::no_sslv3 |
                             ssl::context::no_tlsv1 |
                             ssl::context::no_tlsv1_1);
        ssl_ctx_.set_default_verify_paths();
        ssl_ctx_.set_verify_mode(verify_peer ? ssl::verify_peer : ssl::verify_none);
    }
}

http::request<http::string_body> BeastHttpTransport::build(const HttpRequest& request) const {
    http::request<http::string_body> req{request.method, endpoint_.base_path + request.target, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::user_agent, user_agent_);
    if (!request.body.empty() || request.method == http::verb::post) {
        req.set(http::field::content_type, "application/json");
    }
    for (const auto& h : request.headers) {
        req.set(h.first, h.second);
    }
    req.body() = request.body;
    req.prepare_payload();
    return req;
}

HttpResponse BeastHttpTransport::send(const HttpRequest& request) {
    net::io_context ioc;
    Exchange ex;
    ex.req = build(request);

    if (endpoint_.tls) {
        beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
            throw TransportError("cannot set SNI host name " + endpoint_.host);
        }
        stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));
        run_exchange(ioc, stream, endpoint_, ex, request.timeout);
    } else {
        beast::tcp_stream stream(ioc);
        run_exchange(ioc, stream, endpoint_, ex, request.timeout);
    }

    if (ex.ec) {
        AgentLogger::log(AgentLogger::Level::WARNING, AgentLogger::EventType::TRANSPORT,
                         endpoint_.host + ":" + endpoint_.port + request.target,
                         ex.stage + " failed: " + ex.ec.message());
        throw TransportError(ex.stage + " " + endpoint_.host + ":" + endpoint_.port +
                             request.target + " failed: " + ex.ec.message());
    }
    return HttpResponse{ex.res.result_int(), std::move(ex.res.body())};
}

}
