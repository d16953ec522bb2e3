// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof_output.hpp"

namespace logproof::prover {

static constexpr int kPrettyIndent{2};

std::string render_raw(const nlohmann::json& proof) {
    if (proof.is_string()) {
        return proof.get<std::string>();
    }
    return proof.dump();
}

std::string render_pretty(const nlohmann::json& proof) {
    return proof.dump(kPrettyIndent);
}

}  // namespace logproof::prover
