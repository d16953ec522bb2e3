// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <logproof/chain/settings.hpp>
#include <logproof/chain/types/coordinates.hpp>
#include <logproof/chain/types/receipt.hpp>
#include <logproof/chain/types/transaction.hpp>
#include <logproof/core/common/util.hpp>
#include <logproof/rpc/json_rpc/client.hpp>

namespace logproof::chain {

//! Resolves a transaction hash into the coordinates of one of its event logs by querying an Ethereum JSON-RPC node
class BlockchainResolver {
  public:
    explicit BlockchainResolver(const ResolverSettings& settings);
    explicit BlockchainResolver(std::unique_ptr<rpc::http::Transport> transport);

    BlockchainResolver(const BlockchainResolver&) = delete;
    BlockchainResolver& operator=(const BlockchainResolver&) = delete;

    //! eth_getTransactionByHash
    //! \throws logproof::Error: kInvalidArgument on bad hash, kNotFound on unknown hash, kRemoteCall or kMalformedResponse
    Transaction fetch_transaction(std::string_view tx_hash);

    //! eth_getTransactionReceipt
    //! \throws logproof::Error: kInvalidArgument on bad hash, kNotFound on unknown hash, kRemoteCall or kMalformedResponse
    TransactionReceipt fetch_receipt(std::string_view tx_hash);

    //! Keccak-256 of the event signature text, i.e. the first topic of the logs emitted for that event
    static Hash compute_event_topic_hash(std::string_view event_signature);

    //! Pick the log to prove among the receipt logs
    //! Priority: explicit index (must be in range), then first log whose first topic matches the event signature, then log 0
    static uint32_t select_log_index(const Logs& logs,
                                     std::optional<uint32_t> log_index,
                                     std::optional<std::string_view> event_signature);

    //! Fetch transaction and receipt, then build the coordinates of the selected log
    //! \param chain_id used only when the node does not report the transaction chain ID
    TransactionCoordinates resolve(std::string_view tx_hash,
                                   std::optional<uint32_t> log_index = std::nullopt,
                                   std::optional<std::string_view> event_signature = std::nullopt,
                                   std::optional<ChainId> chain_id = std::nullopt);

    const rpc::http::Endpoint& endpoint() const { return client_.endpoint(); }

    //! Validate the hash and return it with a single lowercase 0x prefix
    static std::string normalize_tx_hash(std::string_view tx_hash);

  private:
    nlohmann::json call(std::string_view method, std::string_view tx_hash);

    rpc::json_rpc::Client client_;
};

}  // namespace logproof::chain
