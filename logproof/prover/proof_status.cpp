// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "proof_status.hpp"

#include <absl/strings/str_cat.h>

#include <logproof/infra/common/error.hpp>

namespace logproof::prover {

ProofState parse_proof_state(std::string_view status) {
    if (status == "pending") return ProofState::kPending;
    if (status == "processing") return ProofState::kProcessing;
    if (status == "complete" || status == "completed") return ProofState::kCompleted;
    if (status == "failed") return ProofState::kFailed;
    return ProofState::kUnknown;
}

std::string_view to_string(ProofState state) {
    switch (state) {
        case ProofState::kPending:
            return "pending";
        case ProofState::kProcessing:
            return "processing";
        case ProofState::kCompleted:
            return "completed";
        case ProofState::kFailed:
            return "failed";
        case ProofState::kUnknown:
            return "unknown";
    }
    return "unknown";
}

void from_json(const nlohmann::json& json, ProofStatus& status) {
    if (!json.is_object()) {
        throw Error{ErrorCode::kMalformedResponse, absl::StrCat("ProofStatus: object expected, got ", json.type_name())};
    }
    const auto status_it{json.find("status")};
    if (status_it == json.end() || !status_it->is_string()) {
        throw Error{ErrorCode::kMalformedResponse, absl::StrCat("ProofStatus: missing status in ", json.dump())};
    }
    status.status = status_it->get<std::string>();
    status.state = parse_proof_state(status.status);

    status.proof.reset();
    if (const auto proof_it{json.find("proof")}; proof_it != json.end() && !proof_it->is_null()) {
        status.proof = *proof_it;
    }

    status.error_message.reset();
    if (const auto error_it{json.find("error")}; error_it != json.end() && !error_it->is_null()) {
        status.error_message = error_it->is_string() ? error_it->get<std::string>() : error_it->dump();
    }
}

std::ostream& operator<<(std::ostream& out, ProofState state) {
    out << to_string(state);
    return out;
}

std::ostream& operator<<(std::ostream& out, const ProofStatus& status) {
    out << "status: " << status.status << " state: " << status.state
        << " proof: " << (status.proof ? "present" : "absent");
    if (status.error_message) {
        out << " error: " << *status.error_message;
    }
    return out;
}

}  // namespace logproof::prover
