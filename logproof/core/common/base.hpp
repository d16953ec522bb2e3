// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic types and constants.

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace logproof {

using namespace std::string_view_literals;

using BlockNum = uint64_t;
using ChainId = uint64_t;

using Bytes = std::basic_string<uint8_t>;
using ByteView = std::basic_string_view<uint8_t>;

inline constexpr size_t kHashLength{32};

}  // namespace logproof
