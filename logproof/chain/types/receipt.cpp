// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "receipt.hpp"

#include <absl/strings/str_join.h>

namespace logproof::chain {

std::ostream& operator<<(std::ostream& out, const LogEntry& log) {
    out << "address: " << log.address
        << " topics: [" << absl::StrJoin(log.topics, ", ") << "]"
        << " data: " << log.data;
    return out;
}

std::ostream& operator<<(std::ostream& out, const TransactionReceipt& receipt) {
    out << "transaction_hash: " << receipt.transaction_hash
        << " transaction_index: " << receipt.transaction_index
        << " block_number: " << receipt.block_number
        << " block_hash: " << receipt.block_hash
        << " status: " << receipt.status
        << " #logs: " << receipt.logs.size();
    return out;
}

}  // namespace logproof::chain
