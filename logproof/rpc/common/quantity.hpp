// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>

namespace logproof::rpc {

//! \brief Convert a JSON-RPC hex quantity (e.g. "0x1b4") into a 64-bit unsigned integer
//! \throws logproof::Error with code kInvalidHex if the input is empty or not hex, kOverflow if it exceeds 64 bits
uint64_t hex_to_uint64(std::string_view hex_quantity);

}  // namespace logproof::rpc
