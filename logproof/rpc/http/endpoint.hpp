// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace logproof::rpc::http {

inline constexpr uint16_t kDefaultHttpPort{80};
inline constexpr uint16_t kDefaultHttpsPort{443};

//! Remote HTTP(S) endpoint addressed by the JSON-RPC clients
struct Endpoint {
    bool tls{false};
    std::string host;
    uint16_t port{0};
    std::string target{"/"};

    //! Parse an absolute URL like "https://host[:port][/path]"
    //! \throws logproof::Error with code kInvalidArgument on unsupported scheme, empty host or bad port
    static Endpoint parse(std::string_view url);

    std::string to_string() const;

    //! Value for the Host header: the port is omitted when it is the default one for the scheme
    std::string host_field() const;
};

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint);

}  // namespace logproof::rpc::http
