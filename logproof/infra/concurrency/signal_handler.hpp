// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <atomic>

namespace logproof {

//! \brief Process-wide SIGINT/SIGTERM hook
//! \details The first signal raises a flag polled by Stoppable, a second one terminates the process at once
class SignalHandler {
  public:
    //! Install the hook for SIGINT and SIGTERM
    //! \throws std::system_error if the hook cannot be installed
    static void init();

    static bool signalled() { return signalled_; }

    //! Clear the signalled state, the hook stays installed
    static void reset() { signalled_ = false; }

    static void handle(int sig_code);

  private:
    static std::atomic_bool signalled_;
};

}  // namespace logproof
