// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace logproof {

//! Throw std::logic_error carrying the message unless the condition holds
//! \note For broken caller preconditions only, runtime failures are reported with logproof::Error
inline void ensure(bool condition, std::string_view message) {
    if (!condition) [[unlikely]] {
        throw std::logic_error{std::string{message}};
    }
}

}  // namespace logproof
