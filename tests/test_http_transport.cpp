#include <gtest/gtest.h>
#include "http_transport.hpp"
#include "errors.hpp"
#include <stdexcept>

using namespace pea;

TEST(BusEndpointTest, PlainWithPort) {
    auto ep = BusEndpoint::parse("http://localhost:3001");
    EXPECT_FALSE(ep.tls);
    EXPECT_EQ(ep.host, "localhost");
    EXPECT_EQ(ep.port, "3001");
    EXPECT_EQ(ep.base_path, "");
}

TEST(BusEndpointTest, TlsDefaultsAndPrefix) {
    auto ep = BusEndpoint::parse("https://bus.example.com/kmp/");
    EXPECT_TRUE(ep.tls);
    EXPECT_EQ(ep.host, "bus.example.com");
    EXPECT_EQ(ep.port, "443");
    EXPECT_EQ(ep.base_path, "/kmp");
}

TEST(BusEndpointTest, PlainDefaultPort) {
    EXPECT_EQ(BusEndpoint::parse("http://bus").port, "80");
}

TEST(BusEndpointTest, Rejects) {
    EXPECT_THROW(BusEndpoint::parse("ftp://bus"), std::invalid_argument);
    EXPECT_THROW(BusEndpoint::parse("http://"), std::invalid_argument);
    EXPECT_THROW(BusEndpoint::parse("localhost:3001"), std::invalid_argument);
}

TEST(HttpRequestTest, HeaderLookupIgnoresCase) {
    HttpRequest req;
    req.headers.emplace_back("X-PEA-Nonce", "n");
    EXPECT_EQ(req.header("x-pea-nonce"), "n");
    EXPECT_EQ(req.header("X-PEA-HMAC"), "");
}

TEST(HttpResponseTest, SuccessRange) {
    EXPECT_TRUE((HttpResponse{200, ""}.ok()));
    EXPECT_TRUE((HttpResponse{204, ""}.ok()));
    EXPECT_FALSE((HttpResponse{301, ""}.ok()));
    EXPECT_FALSE((HttpResponse{500, ""}.ok()));
}

TEST(BeastHttpTransportTest, UnreachableBusIsTransportError) {
    // Port 1 on loopback is closed on any sane test host.
    BeastHttpTransport transport("http://127.0.0.1:1");
    HttpRequest req;
    req.target = "/api/supply-chain/event";
    req.body = "{}";
    req.timeout = std::chrono::seconds(2);

    ::testing::internal::CaptureStdout();
    EXPECT_THROW(transport.send(req), TransportError);
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("[WARN] [TRANSPORT] subject=127.0.0.1:1/api/supply-chain/event"), std::string::npos);
    EXPECT_NE(out.find("connect failed"), std::string::npos);
}
