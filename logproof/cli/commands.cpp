// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "commands.hpp"

#include <optional>
#include <string>

#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>
#include <logproof/prover/proof_output.hpp>

namespace logproof::cli {

std::string_view version() {
    return LOGPROOF_VERSION;
}

ResolverFactory make_resolver_factory() {
    return [](const chain::ResolverSettings& settings) {
        return std::make_unique<chain::BlockchainResolver>(settings);
    };
}

chain::TransactionCoordinates resolve_coordinates(const RequestOptions& options, const ResolverFactory& make_resolver) {
    if (options.tx_hash && !options.tx_hash->empty()) {
        if (options.resolver_settings.rpc_url.empty()) {
            throw Error{ErrorCode::kInvalidArgument, "RPC URL is required when using transaction hash"};
        }
        LOGPROOF_DEBUG << "Connecting to RPC endpoint: " << options.resolver_settings.rpc_url;
        const auto resolver{make_resolver(options.resolver_settings)};
        std::optional<std::string_view> event_signature;
        if (options.event_signature && !options.event_signature->empty()) {
            event_signature = *options.event_signature;
        }
        return resolver->resolve(*options.tx_hash, options.log_index, event_signature, options.chain_id);
    }

    if (!options.chain_id || !options.block_num || !options.tx_index || !options.log_index) {
        throw Error{ErrorCode::kInvalidArgument, "chain-id, block-number, tx-index, and log-index are required"};
    }
    return chain::TransactionCoordinates{
        .chain_id = *options.chain_id,
        .block_num = *options.block_num,
        .tx_index = *options.tx_index,
        .log_index = *options.log_index,
    };
}

static void print_proof(std::ostream& out, const nlohmann::json& proof, bool pretty) {
    if (pretty) {
        out << prover::render_pretty(proof) << "\n";
    } else {
        out << prover::render_raw(proof);
    }
}

void run_request(const RequestOptions& options,
                 const prover::Settings& settings,
                 prover::ProofServiceClient& client,
                 const ResolverFactory& make_resolver,
                 Stoppable* stoppable,
                 std::ostream& out) {
    const auto coordinates{resolve_coordinates(options, make_resolver)};
    LOGPROOF_DEBUG << "Requesting proof for " << coordinates;

    const auto job_id{client.request_proof(coordinates)};
    LOGPROOF_DEBUG << "Proof request submitted successfully, job ID: " << job_id;
    if (!options.wait) {
        out << job_id << "\n";
        return;
    }

    LOGPROOF_DEBUG << "Waiting for proof to be generated (max " << settings.max_attempts << " attempts, "
                   << settings.poll_interval.count() << "ms interval)";
    const prover::WaitOptions wait_options{
        .max_attempts = settings.max_attempts,
        .interval = settings.poll_interval,
        .stoppable = stoppable,
    };
    const auto status{client.wait_for_proof(job_id, wait_options)};
    if (!status.proof) {
        LOGPROOF_WARN << "Job " << job_id << " completed without a proof";
        return;
    }
    LOGPROOF_DEBUG << "Proof generated successfully";
    print_proof(out, *status.proof, settings.debug && !options.raw);
}

void run_status(const StatusOptions& options, const prover::Settings& settings, prover::ProofServiceClient& client, std::ostream& out) {
    LOGPROOF_DEBUG << "Checking status for job ID: " << options.job_id;
    const auto status{client.get_status(options.job_id)};
    const bool proof_ready{status.state == prover::ProofState::kCompleted && status.proof};

    if (!settings.debug) {
        out << status.status << "\n";
        if (proof_ready) {
            out << prover::render_raw(*status.proof);
        }
        return;
    }

    out << "Status: " << status.status << "\n";
    if (status.error_message && !status.error_message->empty()) {
        out << "Error: " << *status.error_message << "\n";
    }
    if (proof_ready) {
        out << "Proof is ready!\n";
        print_proof(out, *status.proof, !options.raw);
    }
}

void run_version(std::ostream& out) {
    out << "logproof v" << version() << "\n";
}

}  // namespace logproof::cli
