// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace logproof::prover {

enum class ProofState {
    kPending,
    kProcessing,
    kCompleted,
    kFailed,
    kUnknown,
};

//! Map a remote status string to its state; "complete" and "completed" are synonyms
ProofState parse_proof_state(std::string_view status);

std::string_view to_string(ProofState state);

//! Snapshot of a proof job as reported by log_queryProof
struct ProofStatus {
    ProofState state{ProofState::kUnknown};
    std::string status;                        // raw status string as sent by the service
    std::optional<nlohmann::json> proof;       // opaque, present when completed
    std::optional<std::string> error_message;  // present when failed

    bool is_terminal() const { return state != ProofState::kPending && state != ProofState::kProcessing; }
};

//! \throws logproof::Error with code kMalformedResponse if the status member is missing or not a string
void from_json(const nlohmann::json& json, ProofStatus& status);

std::ostream& operator<<(std::ostream& out, ProofState state);
std::ostream& operator<<(std::ostream& out, const ProofStatus& status);

}  // namespace logproof::prover
