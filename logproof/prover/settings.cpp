// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "settings.hpp"

#include <absl/strings/str_cat.h>

#include <logproof/infra/common/error.hpp>
#include <logproof/rpc/http/endpoint.hpp>

namespace logproof::prover {

void Settings::validate() const {
    if (api_key.empty()) {
        throw Error{ErrorCode::kInvalidConfig,
                    "API key is required. Set it using --api-key flag, LOGPROOF_API_KEY environment variable, or in the config file"};
    }
    if (max_attempts <= 0) {
        throw Error{ErrorCode::kInvalidConfig, absl::StrCat("max-attempts must be greater than 0, got ", max_attempts)};
    }
    if (poll_interval.count() <= 0) {
        throw Error{ErrorCode::kInvalidConfig, absl::StrCat("interval must be greater than 0, got ", poll_interval.count(), "ms")};
    }
    if (http_timeout.count() <= 0) {
        throw Error{ErrorCode::kInvalidConfig, absl::StrCat("HTTP timeout must be positive, got ", http_timeout.count(), "ms")};
    }
    try {
        rpc::http::Endpoint::parse(api_url);
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kInvalidConfig, "invalid API URL", e);
    }
}

}  // namespace logproof::prover
