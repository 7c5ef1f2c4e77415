// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Loopback tests for rest/http_server.cpp

#include <catch2/catch_test_macros.hpp>
#include "rest/http_server.hpp"
#include "rest/rest_service.hpp"
#include "query/query_engine.hpp"
#include "chain/chainstate_manager.hpp"
#include "chain/validation.hpp"
#include "../test_blocks.hpp"
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include <string>

using namespace chainquery;
using namespace chainquery::test;
using namespace chainquery::rest;
using tcp = boost::asio::ip::tcp;

// Send raw bytes, read until the server closes the connection
static std::string RoundTrip(uint16_t port, const std::string& request) {
    boost::asio::io_context io;
    tcp::socket socket(io);
    socket.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port));
    boost::asio::write(socket, boost::asio::buffer(request));

    std::string response;
    boost::system::error_code ec;
    char buf[1024];
    for (;;) {
        size_t n = socket.read_some(boost::asio::buffer(buf), ec);
        response.append(buf, n);
        if (ec) {
            break;
        }
    }
    return response;
}

static std::string BodyOf(const std::string& response) {
    auto pos = response.find("\r\n\r\n");
    REQUIRE(pos != std::string::npos);
    return response.substr(pos + 4);
}

TEST_CASE("HttpServer - serves requests over loopback", "[rest][http]") {
    validation::ChainstateManager chainstate;
    query::QueryEngine engine(chainstate);
    RestService service(engine);

    auto genesis = MakeBlock(uint256(), 0);
    validation::ValidationState state;
    REQUIRE(chainstate.AcceptBlock(genesis, state).Inserted());

    HttpServer server(service, 2);
    REQUIRE(server.Start("127.0.0.1", 0));
    REQUIRE(server.IsRunning());
    const uint16_t port = server.GetPort();
    REQUIRE(port != 0);

    SECTION("Successful GET") {
        auto response = RoundTrip(port, "GET /latestheight HTTP/1.1\r\nHost: localhost\r\n\r\n");
        REQUIRE(response.rfind("HTTP/1.1 200 OK\r\n", 0) == 0);
        REQUIRE(response.find("Content-Type: application/json\r\n") != std::string::npos);
        REQUIRE(response.find("Connection: close\r\n") != std::string::npos);
        auto body = BodyOf(response);
        REQUIRE(response.find("Content-Length: " + std::to_string(body.size())) !=
                std::string::npos);
        REQUIRE(nlohmann::json::parse(body)["height"] == 0);
    }

    SECTION("Hash endpoint") {
        auto response = RoundTrip(port, "GET /blockheader?" + genesis->GetHash().GetHex() +
                                             " HTTP/1.1\r\n\r\n");
        REQUIRE(response.rfind("HTTP/1.1 200 OK", 0) == 0);
        REQUIRE(nlohmann::json::parse(BodyOf(response))["nonce"] == 0);
    }

    SECTION("Not found") {
        auto response = RoundTrip(port, "GET /blockheight?" + std::string(64, 'b') +
                                             " HTTP/1.1\r\n\r\n");
        REQUIRE(response.rfind("HTTP/1.1 404 Not Found", 0) == 0);
        REQUIRE(nlohmann::json::parse(BodyOf(response))["error"] == "Invalid Block Hash");
    }

    SECTION("Wrong method") {
        auto response = RoundTrip(port, "DELETE /latestblock HTTP/1.1\r\n\r\n");
        REQUIRE(response.rfind("HTTP/1.1 405 Method Not Allowed", 0) == 0);
    }

    SECTION("Malformed request line") {
        auto response = RoundTrip(port, "garbage\r\n\r\n");
        REQUIRE(response.rfind("HTTP/1.1 400 Bad Request", 0) == 0);
        REQUIRE(nlohmann::json::parse(BodyOf(response))["error"] == "Malformed request");
    }

    SECTION("Several sequential connections") {
        for (int i = 0; i < 10; i++) {
            auto response = RoundTrip(port, "GET /latestblock HTTP/1.1\r\n\r\n");
            REQUIRE(response.rfind("HTTP/1.1 200 OK", 0) == 0);
        }
    }

    server.Stop();
    REQUIRE_FALSE(server.IsRunning());
    // Idempotent
    server.Stop();
}

TEST_CASE("HttpServer - start failures", "[rest][http]") {
    validation::ChainstateManager chainstate;
    query::QueryEngine engine(chainstate);
    RestService service(engine);

    SECTION("Invalid bind address") {
        HttpServer server(service, 1);
        REQUIRE_FALSE(server.Start("not-an-address", 0));
        REQUIRE_FALSE(server.IsRunning());
    }

    SECTION("Double start") {
        HttpServer server(service, 1);
        REQUIRE(server.Start("127.0.0.1", 0));
        REQUIRE_FALSE(server.Start("127.0.0.1", 0));
        server.Stop();
    }
}
