// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <string>

#include <logproof/infra/concurrency/task.hpp>
#include <logproof/rpc/http/transport.hpp>

namespace logproof::rpc::http {

inline constexpr std::chrono::milliseconds kDefaultHttpTimeout{60'000};

//! HTTP/1.1 client over plain TCP or TLS issuing one request per connection
//! \details Each post is bounded as a whole (name lookup, connect, handshake, write, read) by the timeout
class Client : public Transport {
  public:
    static constexpr uint64_t kMaxResponseBodySize{64 * 1024 * 1024};

    explicit Client(Endpoint endpoint, std::chrono::milliseconds timeout = kDefaultHttpTimeout);

    Response post(const std::string& body, const Headers& headers) override;

    const Endpoint& endpoint() const override { return endpoint_; }

  private:
    Task<Response> async_post(std::string body, Headers headers, std::chrono::steady_clock::time_point deadline);

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
};

}  // namespace logproof::rpc::http
