// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string_view>

#include <logproof/chain/resolver.hpp>
#include <logproof/cli/options.hpp>
#include <logproof/infra/concurrency/stoppable.hpp>
#include <logproof/prover/client.hpp>

namespace logproof::cli {

std::string_view version();

using ResolverFactory = std::function<std::unique_ptr<chain::BlockchainResolver>(const chain::ResolverSettings&)>;

//! Resolver talking to a real JSON-RPC node
ResolverFactory make_resolver_factory();

//! Coordinates from explicit options or, when a transaction hash is given, from the blockchain node
//! \throws logproof::Error with code kInvalidArgument if neither form is complete
chain::TransactionCoordinates resolve_coordinates(const RequestOptions& options, const ResolverFactory& make_resolver);

//! request: submit the proof request, print the job ID or, with --wait, the proof
void run_request(const RequestOptions& options,
                 const prover::Settings& settings,
                 prover::ProofServiceClient& client,
                 const ResolverFactory& make_resolver,
                 Stoppable* stoppable,
                 std::ostream& out);

//! status: print the job status and the proof when completed
void run_status(const StatusOptions& options, const prover::Settings& settings, prover::ProofServiceClient& client, std::ostream& out);

//! version: print the program version
void run_version(std::ostream& out);

}  // namespace logproof::cli
