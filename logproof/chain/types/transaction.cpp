// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "transaction.hpp"

namespace logproof::chain {

std::ostream& operator<<(std::ostream& out, const Transaction& transaction) {
    out << "hash: " << transaction.hash
        << " block_number: " << transaction.block_number
        << " block_hash: " << transaction.block_hash
        << " from: " << transaction.from
        << " to: " << transaction.to.value_or("null")
        << " chain_id: " << transaction.chain_id.value_or("null");
    return out;
}

}  // namespace logproof::chain
