// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <optional>
#include <utility>

#include <absl/strings/str_cat.h>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>
#include <boost/system/system_error.hpp>

#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>
#include <logproof/infra/concurrency/sync_wait.hpp>

namespace logproof::rpc::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace ssl = boost::asio::ssl;
using boost::asio::use_awaitable;
using boost::asio::ip::tcp;

using StringRequest = bhttp::request<bhttp::string_body>;

static constexpr int kHttpVersion11{11};

template <typename Stream>
static Task<Response> exchange(Stream& stream, const StringRequest& request) {
    co_await bhttp::async_write(stream, request, use_awaitable);

    beast::flat_buffer buffer;
    bhttp::response_parser<bhttp::string_body> parser;
    parser.body_limit(Client::kMaxResponseBodySize);
    co_await bhttp::async_read(stream, buffer, parser, use_awaitable);

    auto& reply{parser.get()};
    co_return Response{.status = reply.result_int(), .body = std::move(reply.body())};
}

Client::Client(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_{std::move(endpoint)}, timeout_{timeout} {}

Response Client::post(const std::string& body, const Headers& headers) {
    LOGPROOF_TRACE << "Client::post " << endpoint_ << " request size: " << body.size();
    const auto deadline{std::chrono::steady_clock::now() + timeout_};
    std::optional<Response> response;
    try {
        response = sync_wait_until(async_post(body, headers, deadline), deadline);
    } catch (const boost::system::system_error& se) {
        LOGPROOF_DEBUG << "Client::post " << endpoint_ << " failed: " << se.code().message();
        throw Error{ErrorCode::kTransport, absl::StrCat("request to ", endpoint_.to_string(), " failed: ", se.code().message())};
    }
    if (!response) {
        LOGPROOF_DEBUG << "Client::post " << endpoint_ << " timed out";
        throw Error{ErrorCode::kTransport, absl::StrCat("request to ", endpoint_.to_string(), " timed out after ", timeout_.count(), "ms")};
    }
    LOGPROOF_TRACE << "Client::post " << endpoint_ << " status: " << response->status << " size: " << response->body.size();
    return std::move(*response);
}

Task<Response> Client::async_post(std::string body, Headers headers, std::chrono::steady_clock::time_point deadline) {
    auto executor = co_await boost::asio::this_coro::executor;

    StringRequest request{bhttp::verb::post, endpoint_.target, kHttpVersion11};
    request.set(bhttp::field::host, endpoint_.host_field());
    request.set(bhttp::field::user_agent, BOOST_BEAST_VERSION_STRING);
    for (const auto& [name, value] : headers) {
        request.set(name, value);
    }
    request.body() = std::move(body);
    request.prepare_payload();

    tcp::resolver resolver{executor};
    const auto endpoints = co_await resolver.async_resolve(endpoint_.host, std::to_string(endpoint_.port), use_awaitable);

    if (endpoint_.tls) {
        ssl::context ssl_context{ssl::context::tls_client};
        ssl_context.set_default_verify_paths();

        beast::ssl_stream<beast::tcp_stream> stream{executor, ssl_context};
        stream.set_verify_mode(ssl::verify_peer);
        stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
            throw boost::system::system_error{static_cast<int>(::ERR_get_error()), boost::asio::error::get_ssl_category()};
        }

        beast::get_lowest_layer(stream).expires_at(deadline);
        co_await beast::get_lowest_layer(stream).async_connect(endpoints, use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, use_awaitable);

        auto response = co_await http::exchange(stream, request);

        boost::system::error_code ec;
        beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ec);
        if (ec) {
            LOGPROOF_TRACE << "Client::async_post shutdown: " << ec.message();
        }
        co_return response;
    }

    beast::tcp_stream stream{executor};
    stream.expires_at(deadline);
    co_await stream.async_connect(endpoints, use_awaitable);

    auto response = co_await http::exchange(stream, request);

    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    if (ec) {
        LOGPROOF_TRACE << "Client::async_post shutdown: " << ec.message();
    }
    co_return response;
}

}  // namespace logproof::rpc::http
