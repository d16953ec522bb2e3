// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include <logproof/infra/common/log.hpp>
#include <logproof/rpc/http/client.hpp>

namespace logproof::prover {

inline constexpr std::string_view kDefaultApiUrl{"https://proof.testnet.polymer.zone"};
inline constexpr int kDefaultMaxAttempts{20};
inline constexpr std::chrono::milliseconds kDefaultPollInterval{3'000};

//! Configuration loaded once at startup and handed by const reference to the clients
struct Settings {
    log::Settings log_settings;
    std::string api_key;
    std::string api_url{kDefaultApiUrl};
    bool debug{false};
    int max_attempts{kDefaultMaxAttempts};
    std::chrono::milliseconds poll_interval{kDefaultPollInterval};
    std::chrono::milliseconds http_timeout{rpc::http::kDefaultHttpTimeout};

    //! \throws logproof::Error with code kInvalidConfig
    void validate() const;
};

}  // namespace logproof::prover
