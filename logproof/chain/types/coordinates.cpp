// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "coordinates.hpp"

#include <absl/strings/str_cat.h>

namespace logproof::chain {

std::string TransactionCoordinates::to_string() const {
    return absl::StrCat("chain_id=", chain_id, " block_num=", block_num, " tx_index=", tx_index, " log_index=", log_index);
}

std::ostream& operator<<(std::ostream& out, const TransactionCoordinates& coordinates) {
    out << coordinates.to_string();
    return out;
}

}  // namespace logproof::chain
