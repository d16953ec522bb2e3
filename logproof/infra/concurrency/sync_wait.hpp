// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <thread>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/use_future.hpp>

#include <logproof/infra/concurrency/task.hpp>

namespace logproof {

/**
 * Do a synchronous wait of a coroutine bounded by a deadline
 *
 * sync_wait_until:
 * - schedules the coroutine on a private io_context run by the calling thread
 * - returns the result of the coroutine or rethrows its exception if it completes before the deadline
 * - returns std::nullopt once the deadline has passed
 *
 * On expiry the io_context is stopped and released on a detached thread: its destruction waits for
 * blocking work started outside the event loop (e.g. a name lookup) which must not hold up the caller.
 */
template <typename T>
std::optional<T> sync_wait_until(Task<T>&& task, std::chrono::steady_clock::time_point deadline) {
    auto io_context{std::make_unique<boost::asio::io_context>()};
    auto future_result = boost::asio::co_spawn(*io_context, std::move(task), boost::asio::use_future);
    io_context->run_until(deadline);
    if (future_result.wait_for(std::chrono::seconds::zero()) == std::future_status::ready) {
        return future_result.get();
    }
    io_context->stop();
    std::thread{[abandoned = std::move(io_context)]() mutable { abandoned.reset(); }}.detach();
    return std::nullopt;
}

}  // namespace logproof
