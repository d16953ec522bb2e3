// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include <logproof/rpc/http/transport.hpp>

namespace logproof::rpc::json_rpc {

inline constexpr std::string_view kJsonRpcVersion{"2.0"};
inline constexpr int kRequestId{1};

//! JSON-RPC 2.0 caller over a synchronous HTTP transport
class Client {
  public:
    //! \param bearer_token if not empty, sent as "Authorization: Bearer <token>" on every call
    explicit Client(std::unique_ptr<http::Transport> transport, std::string bearer_token = {});

    //! Issue one call and return its \a result member (null if absent)
    //! \throws logproof::Error with code kTransport, kHttpStatus, kMalformedResponse or kJsonRpc
    nlohmann::json call(std::string_view method, nlohmann::json params);

    const http::Endpoint& endpoint() const { return transport_->endpoint(); }

    static nlohmann::json make_request(std::string_view method, nlohmann::json params);

  private:
    std::unique_ptr<http::Transport> transport_;
    http::Headers headers_;
};

}  // namespace logproof::rpc::json_rpc
