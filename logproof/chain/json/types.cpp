// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <absl/strings/str_cat.h>

#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>

namespace logproof::chain {

static void ensure_object(const nlohmann::json& json, std::string_view type) {
    if (!json.is_object()) {
        throw Error{ErrorCode::kMalformedResponse, absl::StrCat(type, ": object expected, got ", json.type_name())};
    }
}

static std::optional<std::string> optional_string(const nlohmann::json& json, const char* key, std::string_view type) {
    const auto it{json.find(key)};
    if (it == json.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw Error{ErrorCode::kMalformedResponse, absl::StrCat(type, ": string expected in ", key, ", got ", it->type_name())};
    }
    return it->get<std::string>();
}

static std::string string_or_empty(const nlohmann::json& json, const char* key, std::string_view type) {
    return optional_string(json, key, type).value_or("");
}

void from_json(const nlohmann::json& json, Transaction& transaction) {
    LOGPROOF_TRACE << "from_json<Transaction> json: " << json.dump();
    ensure_object(json, "Transaction");
    transaction.hash = string_or_empty(json, "hash", "Transaction");
    transaction.block_number = string_or_empty(json, "blockNumber", "Transaction");
    transaction.block_hash = string_or_empty(json, "blockHash", "Transaction");
    transaction.from = string_or_empty(json, "from", "Transaction");
    transaction.to = optional_string(json, "to", "Transaction");
    transaction.chain_id = optional_string(json, "chainId", "Transaction");
}

void from_json(const nlohmann::json& json, LogEntry& log) {
    ensure_object(json, "Log");
    log.address = string_or_empty(json, "address", "Log");
    log.data = string_or_empty(json, "data", "Log");
    log.log_index = string_or_empty(json, "logIndex", "Log");
    log.transaction_index = string_or_empty(json, "transactionIndex", "Log");
    log.topics.clear();
    if (const auto it{json.find("topics")}; it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw Error{ErrorCode::kMalformedResponse, absl::StrCat("Log: array expected in topics, got ", it->type_name())};
        }
        for (const auto& topic : *it) {
            if (!topic.is_string()) {
                throw Error{ErrorCode::kMalformedResponse, absl::StrCat("Log: string expected in topics, got ", topic.type_name())};
            }
            log.topics.push_back(topic.get<std::string>());
        }
    }
}

void from_json(const nlohmann::json& json, TransactionReceipt& receipt) {
    LOGPROOF_TRACE << "from_json<TransactionReceipt> json: " << json.dump();
    ensure_object(json, "Receipt");
    receipt.transaction_hash = string_or_empty(json, "transactionHash", "Receipt");
    receipt.transaction_index = string_or_empty(json, "transactionIndex", "Receipt");
    receipt.block_number = string_or_empty(json, "blockNumber", "Receipt");
    receipt.block_hash = string_or_empty(json, "blockHash", "Receipt");
    receipt.status = string_or_empty(json, "status", "Receipt");
    receipt.logs.clear();
    if (const auto it{json.find("logs")}; it != json.end() && !it->is_null()) {
        if (!it->is_array()) {
            throw Error{ErrorCode::kMalformedResponse, absl::StrCat("Receipt: array expected in logs, got ", it->type_name())};
        }
        receipt.logs.reserve(it->size());
        for (const auto& log_json : *it) {
            LogEntry log;
            from_json(log_json, log);
            receipt.logs.push_back(std::move(log));
        }
    }
}

}  // namespace logproof::chain
