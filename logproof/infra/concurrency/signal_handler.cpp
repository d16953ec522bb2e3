// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "signal_handler.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <system_error>

namespace logproof {

std::atomic_bool SignalHandler::signalled_{false};

static void install(int sig_code) {
#if defined(_WIN32)
    // Windows restores the default disposition on delivery, handle() installs again
    if (std::signal(sig_code, &SignalHandler::handle) == SIG_ERR) {
        throw std::system_error{errno, std::generic_category(), "signal"};
    }
#else
    struct sigaction action {};
    action.sa_handler = &SignalHandler::handle;
    sigemptyset(&action.sa_mask);
    if (::sigaction(sig_code, &action, nullptr) == -1) {
        throw std::system_error{errno, std::generic_category(), "sigaction"};
    }
#endif
}

void SignalHandler::init() {
    install(SIGINT);
    install(SIGTERM);
}

void SignalHandler::handle(int sig_code) {
    if (signalled_.exchange(true)) {
        std::_Exit(128 + sig_code);
    }
#if defined(_WIN32)
    (void)std::signal(sig_code, &SignalHandler::handle);
#endif
}

}  // namespace logproof
