// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <nlohmann/json.hpp>

#include <logproof/chain/types/receipt.hpp>
#include <logproof/chain/types/transaction.hpp>

namespace logproof::chain {

//! Decoders for Ethereum JSON-RPC objects; absent or null optional members are tolerated
//! \throws logproof::Error with code kMalformedResponse when a member has the wrong JSON type
void from_json(const nlohmann::json& json, Transaction& transaction);
void from_json(const nlohmann::json& json, LogEntry& log);
void from_json(const nlohmann::json& json, TransactionReceipt& receipt);

}  // namespace logproof::chain
