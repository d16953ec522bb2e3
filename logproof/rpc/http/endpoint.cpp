// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "endpoint.hpp"

#include <charconv>

#include <absl/strings/match.h>
#include <absl/strings/str_cat.h>

#include <logproof/infra/common/error.hpp>

namespace logproof::rpc::http {

static constexpr std::string_view kHttpScheme{"http://"};
static constexpr std::string_view kHttpsScheme{"https://"};

Endpoint Endpoint::parse(std::string_view url) {
    Endpoint endpoint;
    std::string_view rest;
    if (absl::StartsWithIgnoreCase(url, kHttpsScheme)) {
        endpoint.tls = true;
        rest = url.substr(kHttpsScheme.size());
    } else if (absl::StartsWithIgnoreCase(url, kHttpScheme)) {
        rest = url.substr(kHttpScheme.size());
    } else {
        throw Error{ErrorCode::kInvalidArgument, absl::StrCat("unsupported URL (expected http:// or https://): ", url)};
    }

    const auto path_pos{rest.find('/')};
    auto authority{rest.substr(0, path_pos)};
    if (path_pos != std::string_view::npos) {
        endpoint.target = std::string{rest.substr(path_pos)};
    }

    const auto port_pos{authority.rfind(':')};
    if (port_pos == std::string_view::npos) {
        endpoint.port = endpoint.tls ? kDefaultHttpsPort : kDefaultHttpPort;
    } else {
        const auto port{authority.substr(port_pos + 1)};
        const auto [ptr, ec]{std::from_chars(port.data(), port.data() + port.size(), endpoint.port)};
        if (port.empty() || ec != std::errc{} || ptr != port.data() + port.size() || endpoint.port == 0) {
            throw Error{ErrorCode::kInvalidArgument, absl::StrCat("invalid port in URL: ", url)};
        }
        authority = authority.substr(0, port_pos);
    }
    if (authority.empty()) {
        throw Error{ErrorCode::kInvalidArgument, absl::StrCat("missing host in URL: ", url)};
    }
    endpoint.host = std::string{authority};
    return endpoint;
}

std::string Endpoint::to_string() const {
    return absl::StrCat(tls ? kHttpsScheme : kHttpScheme, host, ":", port, target);
}

std::string Endpoint::host_field() const {
    if (port == (tls ? kDefaultHttpsPort : kDefaultHttpPort)) {
        return host;
    }
    return absl::StrCat(host, ":", port);
}

std::ostream& operator<<(std::ostream& out, const Endpoint& endpoint) {
    out << endpoint.to_string();
    return out;
}

}  // namespace logproof::rpc::http
