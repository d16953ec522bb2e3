// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint.hpp"

#include <catch2/catch_test_macros.hpp>

#include <logproof/infra/common/error.hpp>

namespace logproof::rpc::http {

TEST_CASE("Endpoint::parse", "[rpc][http][endpoint]") {
    SECTION("https with default port and path") {
        const auto endpoint{Endpoint::parse("https://proof.testnet.polymer.zone")};
        CHECK(endpoint.tls);
        CHECK(endpoint.host == "proof.testnet.polymer.zone");
        CHECK(endpoint.port == 443);
        CHECK(endpoint.target == "/");
    }

    SECTION("http with explicit port") {
        const auto endpoint{Endpoint::parse("http://localhost:8545")};
        CHECK_FALSE(endpoint.tls);
        CHECK(endpoint.host == "localhost");
        CHECK(endpoint.port == 8545);
        CHECK(endpoint.target == "/");
    }

    SECTION("path and query are kept as target") {
        const auto endpoint{Endpoint::parse("https://eth-mainnet.example.com/v2/abc?x=1")};
        CHECK(endpoint.host == "eth-mainnet.example.com");
        CHECK(endpoint.port == 443);
        CHECK(endpoint.target == "/v2/abc?x=1");
    }

    SECTION("scheme is case insensitive") {
        CHECK(Endpoint::parse("HTTPS://host").tls);
    }

    SECTION("to_string") {
        CHECK(Endpoint::parse("http://127.0.0.1:8545/rpc").to_string() == "http://127.0.0.1:8545/rpc");
        CHECK(Endpoint::parse("https://host").to_string() == "https://host:443/");
    }

    SECTION("host_field") {
        CHECK(Endpoint::parse("http://node:8545/rpc").host_field() == "node:8545");
        CHECK(Endpoint::parse("https://node:8443").host_field() == "node:8443");
        CHECK(Endpoint::parse("http://node").host_field() == "node");
        CHECK(Endpoint::parse("https://node:443/").host_field() == "node");
        CHECK(Endpoint::parse("http://node:443").host_field() == "node:443");
    }

    SECTION("invalid URLs") {
        CHECK_THROWS_AS(Endpoint::parse("ftp://host"), Error);
        CHECK_THROWS_AS(Endpoint::parse("host:8545"), Error);
        CHECK_THROWS_AS(Endpoint::parse("http://"), Error);
        CHECK_THROWS_AS(Endpoint::parse("http://host:"), Error);
        CHECK_THROWS_AS(Endpoint::parse("http://host:0"), Error);
        CHECK_THROWS_AS(Endpoint::parse("http://host:70000"), Error);
        CHECK_THROWS_AS(Endpoint::parse("http://host:80a"), Error);
    }
}

}  // namespace logproof::rpc::http
