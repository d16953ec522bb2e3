// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <utility>

#include <absl/strings/str_cat.h>

#include <logproof/core/common/util.hpp>
#include <logproof/infra/common/ensure.hpp>
#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>

namespace logproof::rpc::json_rpc {

static constexpr size_t kMaxLoggedBodySize{1024};

Client::Client(std::unique_ptr<http::Transport> transport, std::string bearer_token)
    : transport_{std::move(transport)} {
    ensure(transport_ != nullptr, "json_rpc::Client: transport must not be null");
    headers_.emplace_back("Content-Type", "application/json");
    headers_.emplace_back("Accept", "application/json");
    if (!bearer_token.empty()) {
        headers_.emplace_back("Authorization", absl::StrCat("Bearer ", bearer_token));
    }
}

nlohmann::json Client::make_request(std::string_view method, nlohmann::json params) {
    return {
        {"jsonrpc", std::string{kJsonRpcVersion}},
        {"id", kRequestId},
        {"method", std::string{method}},
        {"params", std::move(params)},
    };
}

nlohmann::json Client::call(std::string_view method, nlohmann::json params) {
    const auto request_body{make_request(method, std::move(params)).dump()};
    LOGPROOF_DEBUG << "JSON-RPC request to " << endpoint() << ": " << request_body;

    const auto response{transport_->post(request_body, headers_)};
    LOGPROOF_DEBUG << "JSON-RPC response status: " << response.status;
    LOGPROOF_DEBUG << "JSON-RPC response body: " << abridge(response.body, kMaxLoggedBodySize);

    if (response.status != 200) {
        throw Error{ErrorCode::kHttpStatus,
                    absl::StrCat(method, " request to ", endpoint().to_string(), " failed with status ", response.status, ": ", response.body)};
    }

    const auto reply = nlohmann::json::parse(response.body, /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (reply.is_discarded() || !reply.is_object()) {
        throw Error{ErrorCode::kMalformedResponse,
                    absl::StrCat("failed to decode ", method, " response from ", endpoint().to_string(), ": ", abridge(response.body, kMaxLoggedBodySize))};
    }

    if (const auto error_it{reply.find("error")}; error_it != reply.end() && !error_it->is_null()) {
        const auto& error{*error_it};
        const auto code{error.is_object() && error.contains("code") ? error["code"].dump() : "?"};
        const auto message{error.is_object() && error.contains("message") && error["message"].is_string()
                               ? error["message"].get<std::string>()
                               : error.dump()};
        throw Error{ErrorCode::kJsonRpc, absl::StrCat(method, " RPC error (code ", code, "): ", message)};
    }

    const auto result_it{reply.find("result")};
    return result_it != reply.end() ? *result_it : nlohmann::json{};
}

}  // namespace logproof::rpc::json_rpc
