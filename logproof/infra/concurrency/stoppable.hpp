// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

#include <logproof/infra/concurrency/signal_handler.hpp>

namespace logproof {

//! \brief Components implementing stop-ability should derive from this
class Stoppable {
  public:
    //! Granularity used to notice stop requests raised from a signal handler, which cannot notify
    static constexpr std::chrono::milliseconds kSignalCheckInterval{100};

    //! \brief Sets a stop request for instance;
    //! \return True if the stop request has been triggered otherwise false (i.e. was already stopping)
    virtual bool stop() {
        bool expected{false};
        const bool triggered{stopping_.compare_exchange_strong(expected, true)};
        if (triggered) {
            std::scoped_lock lock{mutex_};
            stop_requested_.notify_all();
        }
        return triggered;
    }

    //! \brief Whether a stop request has been issued
    bool is_stopping() const { return stopping_.load() || SignalHandler::signalled(); }

    //! \brief Block the caller for the given duration or until a stop request is issued, whichever comes first
    //! \return True if the wait was interrupted by a stop request
    bool wait_for(std::chrono::milliseconds duration) {
        const auto deadline{std::chrono::steady_clock::now() + duration};
        std::unique_lock lock{mutex_};
        while (!is_stopping()) {
            const auto now{std::chrono::steady_clock::now()};
            if (now >= deadline) {
                return false;
            }
            const auto slice{std::min<std::chrono::steady_clock::duration>(deadline - now, kSignalCheckInterval)};
            stop_requested_.wait_for(lock, slice, [this]() { return stopping_.load(); });
        }
        return true;
    }

    virtual ~Stoppable() = default;

  private:
    std::atomic_bool stopping_{false};
    std::mutex mutex_;
    std::condition_variable stop_requested_;
};

}  // namespace logproof
