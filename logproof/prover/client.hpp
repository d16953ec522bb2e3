// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <logproof/chain/types/coordinates.hpp>
#include <logproof/infra/concurrency/stoppable.hpp>
#include <logproof/prover/proof_status.hpp>
#include <logproof/prover/settings.hpp>
#include <logproof/rpc/json_rpc/client.hpp>

namespace logproof::prover {

inline constexpr std::string_view kRequestProofMethod{"log_requestProof"};
inline constexpr std::string_view kQueryProofMethod{"log_queryProof"};

//! Polling parameters of ProofServiceClient::wait_for_proof
struct WaitOptions {
    int max_attempts{kDefaultMaxAttempts};
    std::chrono::milliseconds interval{kDefaultPollInterval};
    //! Polling gives up with kDeadlineExceeded once this point in time is reached
    std::optional<std::chrono::steady_clock::time_point> deadline;
    //! Polling gives up with kCancelled once a stop is requested, sleeps are interrupted too
    Stoppable* stoppable{nullptr};
};

//! Client of the proving service JSON-RPC API (bearer token authentication)
class ProofServiceClient {
  public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    explicit ProofServiceClient(const Settings& settings);

    //! \param sleep replaces the wait between polling attempts if not empty
    ProofServiceClient(const Settings& settings, std::unique_ptr<rpc::http::Transport> transport, SleepFunction sleep = {});

    ProofServiceClient(const ProofServiceClient&) = delete;
    ProofServiceClient& operator=(const ProofServiceClient&) = delete;

    //! Submit a proof request for one log
    //! \return the job identifier in decimal string form
    //! \throws logproof::Error with code kSubmission
    std::string request_proof(ChainId chain_id, BlockNum block_num, uint32_t tx_index, uint32_t log_index);
    std::string request_proof(const chain::TransactionCoordinates& coordinates);

    //! Fetch the current status of a proof job
    //! \throws logproof::Error with code kInvalidJobId, kSubmission or kMalformedResponse
    ProofStatus get_status(std::string_view job_id);

    //! Poll the job status until completion
    //! \throws logproof::Error with code kProofFailed, kUnknownStatus, kPollingTimeout, kCancelled, kDeadlineExceeded
    //! or any error raised by get_status
    ProofStatus wait_for_proof(std::string_view job_id, const WaitOptions& options);

    //! Poll using max attempts and interval from settings
    ProofStatus wait_for_proof(std::string_view job_id);

    const rpc::http::Endpoint& endpoint() const { return client_.endpoint(); }

    //! Parse a job identifier into the numeric form sent on the wire
    //! \throws logproof::Error with code kInvalidJobId
    static uint64_t parse_job_id(std::string_view job_id);

    //! Normalize a log_requestProof result (string or number) into the job identifier string
    //! \throws logproof::Error with code kMalformedResponse if the result is neither a string nor a number
    //! representable as a 64-bit unsigned integer
    static std::string normalize_job_id(const nlohmann::json& result);

  private:
    void sleep(const WaitOptions& options, std::chrono::milliseconds duration);
    static void check_interrupted(const WaitOptions& options);

    rpc::json_rpc::Client client_;
    int max_attempts_;
    std::chrono::milliseconds poll_interval_;
    SleepFunction sleep_;
};

}  // namespace logproof::prover
