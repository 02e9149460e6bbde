/**
 * @file TestEndpoint.cpp
 * @brief Unit tests for synapse::net::parseEndpoint.
 */

#include <catch2/catch_test_macros.hpp>

#include <synapse/net/Endpoint.hpp>

using namespace synapse;
using namespace synapse::net;

TEST_CASE("parseEndpoint reads host, port and path", "[net][endpoint]")
{
    auto ep = parseEndpoint("ws://192.168.1.20:9000/stream");
    REQUIRE(ep.has_value());
    REQUIRE(ep->host == "192.168.1.20");
    REQUIRE(ep->port == 9000);
    REQUIRE(ep->target == "/stream");
}

TEST_CASE("parseEndpoint applies the default port and path", "[net][endpoint]")
{
    auto ep = parseEndpoint("ws://localhost");
    REQUIRE(ep.has_value());
    REQUIRE(ep->host == "localhost");
    REQUIRE(ep->port == 8081);
    REQUIRE(ep->target == "/");
    REQUIRE(ep->toString() == "ws://localhost:8081/");
}

TEST_CASE("parseEndpoint keeps the reference endpoint", "[net][endpoint]")
{
    auto ep = parseEndpoint("ws://localhost:8081");
    REQUIRE(ep.has_value());
    REQUIRE(*ep == Endpoint{});
}

TEST_CASE("parseEndpoint rejects malformed URLs", "[net][endpoint]")
{
    for (const char* url : {"http://localhost:8081", "localhost:8081", "ws://", "ws://:8081",
                            "ws://host:0", "ws://host:65536", "ws://host:80a", "ws://host:/x"})
    {
        INFO(url);
        auto ep = parseEndpoint(url);
        REQUIRE_FALSE(ep.has_value());
        REQUIRE(ep.error().code() == core::ErrorCode::kInvalidArgument);
    }
}
