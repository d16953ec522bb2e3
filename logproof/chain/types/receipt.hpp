// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <ostream>
#include <string>
#include <vector>

namespace logproof::chain {

//! Event log entry of a receipt, its position in the receipt is the log index used for proofs
struct LogEntry {
    std::string address;
    std::vector<std::string> topics;
    std::string data;
    std::string log_index;
    std::string transaction_index;
};

using Logs = std::vector<LogEntry>;

//! Receipt as returned by eth_getTransactionReceipt, numeric fields kept as hex quantities
struct TransactionReceipt {
    std::string transaction_hash;
    std::string transaction_index;
    std::string block_number;
    std::string block_hash;
    std::string status;
    Logs logs;
};

std::ostream& operator<<(std::ostream& out, const LogEntry& log);
std::ostream& operator<<(std::ostream& out, const TransactionReceipt& receipt);

}  // namespace logproof::chain
