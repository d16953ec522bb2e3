// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <logproof/rpc/http/client.hpp>

namespace logproof::chain {

struct ResolverSettings {
    std::string rpc_url;
    std::chrono::milliseconds http_timeout{rpc::http::kDefaultHttpTimeout};
};

}  // namespace logproof::chain
