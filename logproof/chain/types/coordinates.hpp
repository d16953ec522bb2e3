// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <ostream>
#include <string>

#include <logproof/core/common/base.hpp>

namespace logproof::chain {

//! Location of one event log on one chain: all a proof request needs
struct TransactionCoordinates {
    ChainId chain_id{0};
    BlockNum block_num{0};
    uint32_t tx_index{0};
    uint32_t log_index{0};

    std::string to_string() const;

    friend bool operator==(const TransactionCoordinates&, const TransactionCoordinates&) = default;
};

std::ostream& operator<<(std::ostream& out, const TransactionCoordinates& coordinates);

}  // namespace logproof::chain
