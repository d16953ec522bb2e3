// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <gmock/gmock.h>
#include <nlohmann/json.hpp>

#include <logproof/rpc/http/transport.hpp>

namespace logproof::rpc::test_util {

class MockTransport : public http::Transport {  // NOLINT
  public:
    explicit MockTransport(std::string_view url = "http://localhost:8545") : endpoint_{http::Endpoint::parse(url)} {}

    MOCK_METHOD((http::Response), post, (const std::string&, const http::Headers&), (override));

    const http::Endpoint& endpoint() const override { return endpoint_; }

  private:
    http::Endpoint endpoint_;
};

//! HTTP 200 reply carrying a JSON-RPC success envelope
inline http::Response json_rpc_result(const nlohmann::json& result) {
    return {200, nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"result", result}}.dump()};
}

//! HTTP 200 reply carrying a JSON-RPC error envelope
inline http::Response json_rpc_error(int code, const std::string& message) {
    return {200, nlohmann::json{{"jsonrpc", "2.0"}, {"id", 1}, {"error", {{"code", code}, {"message", message}}}}.dump()};
}

}  // namespace logproof::rpc::test_util
