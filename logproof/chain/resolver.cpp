// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "resolver.hpp"

#include <limits>
#include <utility>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include <logproof/chain/json/types.hpp>
#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>
#include <logproof/rpc/common/quantity.hpp>
#include <logproof/rpc/http/client.hpp>

namespace logproof::chain {

static constexpr std::string_view kGetTransactionByHash{"eth_getTransactionByHash"};
static constexpr std::string_view kGetTransactionReceipt{"eth_getTransactionReceipt"};

BlockchainResolver::BlockchainResolver(const ResolverSettings& settings)
    : BlockchainResolver{std::make_unique<rpc::http::Client>(rpc::http::Endpoint::parse(settings.rpc_url), settings.http_timeout)} {}

BlockchainResolver::BlockchainResolver(std::unique_ptr<rpc::http::Transport> transport)
    : client_{std::move(transport)} {}

std::string BlockchainResolver::normalize_tx_hash(std::string_view tx_hash) {
    const auto bytes{from_hex(tx_hash)};
    if (!bytes || bytes->size() != kHashLength || strip_hex_prefix(tx_hash).size() != 2 * kHashLength) {
        throw Error{ErrorCode::kInvalidArgument, absl::StrCat("invalid transaction hash: '", tx_hash, "'")};
    }
    return to_hex(*bytes, /*with_prefix=*/true);
}

nlohmann::json BlockchainResolver::call(std::string_view method, std::string_view tx_hash) {
    try {
        return client_.call(method, nlohmann::json::array({std::string{tx_hash}}));
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kRemoteCall, absl::StrCat(method, " failed at ", endpoint().to_string()), e);
    }
}

Transaction BlockchainResolver::fetch_transaction(std::string_view tx_hash) {
    const auto hash{normalize_tx_hash(tx_hash)};
    const auto result{call(kGetTransactionByHash, hash)};
    if (result.is_null()) {
        throw Error{ErrorCode::kNotFound, absl::StrCat("transaction not found: ", hash)};
    }
    try {
        return result.get<Transaction>();
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kMalformedResponse, absl::StrCat("failed to decode ", kGetTransactionByHash, " result"), e);
    }
}

TransactionReceipt BlockchainResolver::fetch_receipt(std::string_view tx_hash) {
    const auto hash{normalize_tx_hash(tx_hash)};
    const auto result{call(kGetTransactionReceipt, hash)};
    if (result.is_null()) {
        throw Error{ErrorCode::kNotFound, absl::StrCat("transaction receipt not found: ", hash)};
    }
    try {
        return result.get<TransactionReceipt>();
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kMalformedResponse, absl::StrCat("failed to decode ", kGetTransactionReceipt, " result"), e);
    }
}

Hash BlockchainResolver::compute_event_topic_hash(std::string_view event_signature) {
    return keccak256(event_signature);
}

uint32_t BlockchainResolver::select_log_index(const Logs& logs,
                                              std::optional<uint32_t> log_index,
                                              std::optional<std::string_view> event_signature) {
    if (logs.empty()) {
        throw Error{ErrorCode::kNoLogs, "no logs found in transaction receipt"};
    }

    if (log_index) {
        if (*log_index >= logs.size()) {
            throw Error{ErrorCode::kIndexOutOfRange,
                        absl::StrCat("log index ", *log_index, " is out of range, transaction has ", logs.size(), " logs")};
        }
        return *log_index;
    }

    if (event_signature) {
        const auto signature{absl::StripAsciiWhitespace(*event_signature)};
        const auto topic{to_hex(compute_event_topic_hash(signature), /*with_prefix=*/true)};
        LOGPROOF_DEBUG << "Looking for event " << signature << " with topic " << topic;
        for (size_t i{0}; i < logs.size(); ++i) {
            const auto& topics{logs[i].topics};
            if (!topics.empty() && iequals(topics.front(), topic)) {
                LOGPROOF_DEBUG << "Found matching log at index " << i;
                return static_cast<uint32_t>(i);
            }
        }
        throw Error{ErrorCode::kNoMatchingLog, absl::StrCat("no log found with event signature: ", signature)};
    }

    return 0;
}

TransactionCoordinates BlockchainResolver::resolve(std::string_view tx_hash,
                                                   std::optional<uint32_t> log_index,
                                                   std::optional<std::string_view> event_signature,
                                                   std::optional<ChainId> chain_id) {
    const auto transaction{fetch_transaction(tx_hash)};
    LOGPROOF_DEBUG << "Transaction: " << transaction;
    const auto receipt{fetch_receipt(tx_hash)};
    LOGPROOF_DEBUG << "Receipt: " << receipt;

    const auto selected_log_index{select_log_index(receipt.logs, log_index, event_signature)};

    ChainId resolved_chain_id{0};
    if (transaction.chain_id && !transaction.chain_id->empty()) {
        resolved_chain_id = rpc::hex_to_uint64(*transaction.chain_id);
    } else if (chain_id) {
        resolved_chain_id = *chain_id;
    } else {
        throw Error{ErrorCode::kMissingChainId, "chain ID not found in transaction, please provide it with --chain-id flag"};
    }

    const auto block_num{rpc::hex_to_uint64(receipt.block_number)};
    const auto tx_index{rpc::hex_to_uint64(receipt.transaction_index)};
    if (tx_index > std::numeric_limits<uint32_t>::max()) {
        throw Error{ErrorCode::kOverflow, absl::StrCat("transaction index ", tx_index, " exceeds 32 bits")};
    }

    const TransactionCoordinates coordinates{
        .chain_id = resolved_chain_id,
        .block_num = block_num,
        .tx_index = static_cast<uint32_t>(tx_index),
        .log_index = selected_log_index,
    };
    LOGPROOF_DEBUG << "Resolved " << normalize_tx_hash(tx_hash) << " to " << coordinates;
    return coordinates;
}

}  // namespace logproof::chain
