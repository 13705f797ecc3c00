// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "loopback_server.hpp"

#include <gtest/gtest.h>
#include <httprpc/transport.hpp>
#include <httprpc/transport_http.hpp>

using namespace httprpc;
using httprpc::test::CapturedRequest;
using httprpc::test::LoopbackHttpServer;

// =============================================================================
// URL Tests
// =============================================================================

TEST(UrlTest, ParsesHostPortAndPath)
{
    auto url = Url::parse("http://localhost:10002/jsonrpc?x=1");
    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.host, "localhost");
    EXPECT_EQ(url.port, 10002);
    EXPECT_EQ(url.target, "/jsonrpc?x=1");
}

TEST(UrlTest, DefaultsPortAndTarget)
{
    auto url = Url::parse("HTTP://example.com");
    EXPECT_EQ(url.scheme, "http");
    EXPECT_EQ(url.port, 80);
    EXPECT_EQ(url.target, "/");

    EXPECT_EQ(Url::parse("https://example.com").port, 443);
}

TEST(UrlTest, QueryWithoutPath)
{
    auto url = Url::parse("http://example.com?token=abc");
    EXPECT_EQ(url.host, "example.com");
    EXPECT_EQ(url.target, "/?token=abc");
}

TEST(UrlTest, DropsFragment)
{
    EXPECT_EQ(Url::parse("http://example.com/rpc#frag").target, "/rpc");
}

TEST(UrlTest, Ipv6Literal)
{
    auto url = Url::parse("http://[::1]:8080/rpc");
    EXPECT_EQ(url.host, "::1");
    EXPECT_EQ(url.port, 8080);
}

TEST(UrlTest, RejectsMalformed)
{
    EXPECT_THROW(Url::parse("localhost:8080"), std::invalid_argument);
    EXPECT_THROW(Url::parse("http://"), std::invalid_argument);
    EXPECT_THROW(Url::parse("http://host:notaport/"), std::invalid_argument);
    EXPECT_THROW(Url::parse("http://host:70000/"), std::invalid_argument);
    EXPECT_THROW(Url::parse("http://user:pw@host/"), std::invalid_argument);
    EXPECT_THROW(Url::parse("http://[::1/"), std::invalid_argument);
}

// =============================================================================
// HttpTransport Tests (loopback server)
// =============================================================================

TEST(HttpTransportTest, PostsAndReadsResponse)
{
    LoopbackHttpServer server([](const CapturedRequest& req)
                              { return LoopbackHttpServer::response(200, "echo:" + req.body); });

    HttpTransport transport;
    HttpRequest request;
    request.url = server.url("/jsonrpc");
    request.headers = {{"Content-Type", "application/json"}};
    request.body = R"({"jsonrpc":"2.0","method":"ping","id":1})";

    auto response = transport.post(request);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "echo:" + request.body);

    auto seen = server.requests();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].head.rfind("POST /jsonrpc HTTP/1.1", 0), 0u);
    EXPECT_NE(seen[0].head.find("Content-Type: application/json"), std::string::npos);
    EXPECT_EQ(seen[0].body, request.body);
}

TEST(HttpTransportTest, ReturnsErrorStatusWithoutThrowing)
{
    LoopbackHttpServer server([](const CapturedRequest&)
                              { return LoopbackHttpServer::response(503, "busy", "Service Unavailable"); });

    HttpTransport transport;
    HttpRequest request;
    request.url = server.url();
    request.body = "{}";

    auto response = transport.post(request);
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body, "busy");
}

TEST(HttpTransportTest, ReusableAcrossRequests)
{
    LoopbackHttpServer server([](const CapturedRequest&) { return LoopbackHttpServer::response(200, "ok"); });

    HttpTransport transport;
    HttpRequest request;
    request.url = server.url();
    request.body = "{}";

    for (int i = 0; i < 3; ++i)
        EXPECT_EQ(transport.post(request).body, "ok");
    EXPECT_EQ(server.requests().size(), 3u);
}

TEST(HttpTransportTest, ConnectionRefused)
{
    int port = 0;
    {
        LoopbackHttpServer server([](const CapturedRequest&) { return std::nullopt; });
        port = server.port();
    }

    HttpTransport transport;
    HttpRequest request;
    request.url = "http://127.0.0.1:" + std::to_string(port) + "/";
    request.body = "{}";

    EXPECT_THROW(transport.post(request), TransportError);
}

TEST(HttpTransportTest, ReadTimeout)
{
    LoopbackHttpServer server([](const CapturedRequest&) { return std::nullopt; });

    HttpTransportOptions options;
    options.io_timeout = std::chrono::milliseconds(200);
    HttpTransport transport(options);

    HttpRequest request;
    request.url = server.url();
    request.body = "{}";

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(transport.post(request), TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(5));
}

// =============================================================================
// Malformed Response Tests (loopback server)
// =============================================================================

namespace
{

HttpRequest post_to(const LoopbackHttpServer& server)
{
    HttpRequest request;
    request.url = server.url("/rpc");
    request.headers = {{"Content-Type", "application/json"}};
    request.body = R"({"jsonrpc":"2.0","method":"ping","id":1})";
    return request;
}

} // namespace

TEST(HttpTransportTest, OverflowingContentLengthIsTransportError)
{
    LoopbackHttpServer server(
        [](const CapturedRequest&)
        { return std::string("HTTP/1.1 200 OK\r\nContent-Length: 99999999999999999999999\r\n\r\n{}"); }
    );

    HttpTransport transport;
    EXPECT_THROW(transport.post(post_to(server)), TransportError);
}

TEST(HttpTransportTest, OversizedChunkIsTransportError)
{
    LoopbackHttpServer server(
        [](const CapturedRequest&)
        {
            return std::string(
                "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                "FFFFFFFFFFFFFFFE\r\n0\r\n\r\n"
            );
        }
    );

    HttpTransport transport;
    EXPECT_THROW(transport.post(post_to(server)), TransportError);
}

TEST(HttpTransportTest, TruncatedBodyIsTransportError)
{
    LoopbackHttpServer server(
        [](const CapturedRequest&)
        { return std::string("HTTP/1.1 200 OK\r\nContent-Length: 100\r\n\r\n{\"jsonrpc\":\"2.0\""); }
    );

    HttpTransport transport;
    EXPECT_THROW(transport.post(post_to(server)), TransportError);
}

TEST(HttpTransportTest, ConnectionResetMidBodyIsTransportError)
{
    LoopbackHttpServer server(
        [](const CapturedRequest&)
        { return std::string("HTTP/1.1 200 OK\r\nContent-Length: 64\r\n\r\n{\"jsonrpc\":\"2.0\",\"res"); }
    );
    server.set_reset_after_reply(true);

    HttpTransport transport;
    EXPECT_THROW(transport.post(post_to(server)), TransportError);
}

TEST(HttpTransportTest, ResponseOverMaximumSizeIsTransportError)
{
    std::string big(4096, 'x');
    LoopbackHttpServer server([&big](const CapturedRequest&) { return LoopbackHttpServer::response(200, big); });

    HttpTransportOptions options;
    options.max_response_size = 1024;
    HttpTransport transport(options);

    try
    {
        transport.post(post_to(server));
        FAIL() << "Expected TransportError";
    }
    catch (const TransportError& e)
    {
        EXPECT_NE(std::string(e.what()).find("maximum size"), std::string::npos);
    }
}

TEST(HttpTransportTest, ChunkedResponseIsDecoded)
{
    LoopbackHttpServer server(
        [](const CapturedRequest&)
        {
            return std::string(
                "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
                "4\r\n{\"re\r\n"
                "b\r\nsult\":true}\r\n"
                "0\r\n\r\n"
            );
        }
    );

    HttpTransport transport;
    auto response = transport.post(post_to(server));
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, R"({"result":true})");
    EXPECT_EQ(response.header("transfer-encoding").value_or(""), "chunked");
}

TEST(HttpTransportTest, RejectsHttpsAndBadUrls)
{
    HttpTransport transport;
    HttpRequest request;
    request.body = "{}";

    request.url = "https://example.com/rpc";
    EXPECT_THROW(transport.post(request), TransportError);

    request.url = "not a url";
    EXPECT_THROW(transport.post(request), TransportError);
}

TEST(HttpTransportTest, PostAfterCloseThrows)
{
    HttpTransport transport;
    EXPECT_TRUE(transport.is_open());

    transport.close();
    transport.close();
    EXPECT_FALSE(transport.is_open());

    HttpRequest request;
    request.url = "http://127.0.0.1:1/";
    EXPECT_THROW(transport.post(request), TransportError);
}
