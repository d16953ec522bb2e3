// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "quantity.hpp"

#include <charconv>

#include <absl/strings/str_cat.h>

#include <logproof/core/common/util.hpp>
#include <logproof/infra/common/error.hpp>

namespace logproof::rpc {

static constexpr size_t kMaxUint64HexDigits{16};

uint64_t hex_to_uint64(std::string_view hex_quantity) {
    if (hex_quantity == "0x0") {
        return 0;
    }
    if (!is_valid_hex(hex_quantity)) {
        throw Error{ErrorCode::kInvalidHex, absl::StrCat("invalid hex quantity: '", hex_quantity, "'")};
    }
    auto digits{strip_hex_prefix(hex_quantity)};
    const auto first_significant{digits.find_first_not_of('0')};
    if (first_significant == std::string_view::npos) {
        return 0;
    }
    digits.remove_prefix(first_significant);
    if (digits.size() > kMaxUint64HexDigits) {
        throw Error{ErrorCode::kOverflow, absl::StrCat("hex value ", hex_quantity, " exceeds 64 bits")};
    }

    uint64_t value{0};
    const auto [ptr, ec]{std::from_chars(digits.data(), digits.data() + digits.size(), value, 16)};
    if (ec == std::errc::result_out_of_range) {
        throw Error{ErrorCode::kOverflow, absl::StrCat("hex value ", hex_quantity, " exceeds 64 bits")};
    }
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw Error{ErrorCode::kInvalidHex, absl::StrCat("invalid hex quantity: '", hex_quantity, "'")};
    }
    return value;
}

}  // namespace logproof::rpc
