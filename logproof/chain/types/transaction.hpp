// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>

namespace logproof::chain {

//! Transaction as returned by eth_getTransactionByHash, numeric fields kept as hex quantities
struct Transaction {
    std::string hash;
    std::string block_number;
    std::string block_hash;
    std::string from;
    std::optional<std::string> to;        // absent for contract creation
    std::optional<std::string> chain_id;  // absent for legacy pre-EIP-155 transactions
};

std::ostream& operator<<(std::ostream& out, const Transaction& transaction);

}  // namespace logproof::chain
