// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>
#include <utility>
#include <vector>

#include <logproof/rpc/http/endpoint.hpp>

namespace logproof::rpc::http {

using Header = std::pair<std::string, std::string>;
using Headers = std::vector<Header>;

struct Response {
    unsigned int status{0};
    std::string body;
};

//! Synchronous request/response exchange with one remote endpoint
class Transport {
  public:
    virtual ~Transport() = default;

    //! POST the body with the given headers and block until the complete response is received
    //! \throws logproof::Error with code kTransport on connection, TLS, I/O failure or timeout
    virtual Response post(const std::string& body, const Headers& headers) = 0;

    virtual const Endpoint& endpoint() const = 0;
};

}  // namespace logproof::rpc::http
