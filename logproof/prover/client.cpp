// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <thread>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>

#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>
#include <logproof/rpc/http/client.hpp>

namespace logproof::prover {

ProofServiceClient::ProofServiceClient(const Settings& settings)
    : ProofServiceClient{settings, std::make_unique<rpc::http::Client>(rpc::http::Endpoint::parse(settings.api_url), settings.http_timeout)} {}

ProofServiceClient::ProofServiceClient(const Settings& settings, std::unique_ptr<rpc::http::Transport> transport, SleepFunction sleep)
    : client_{std::move(transport), settings.api_key},
      max_attempts_{settings.max_attempts},
      poll_interval_{settings.poll_interval},
      sleep_{std::move(sleep)} {}

uint64_t ProofServiceClient::parse_job_id(std::string_view job_id) {
    const auto invalid_job_id = [&]() {
        return Error{ErrorCode::kInvalidJobId, absl::StrCat("invalid job ID: '", job_id, "'")};
    };

    // Integral floating form like "12345.0" is accepted as well
    auto digits{job_id};
    if (const auto dot{digits.find('.')}; dot != std::string_view::npos) {
        const auto fraction{digits.substr(dot + 1)};
        if (!std::all_of(fraction.cbegin(), fraction.cend(), [](char c) { return c == '0'; })) {
            throw invalid_job_id();
        }
        digits = digits.substr(0, dot);
    }
    uint64_t value{0};
    const auto [ptr, ec]{std::from_chars(digits.data(), digits.data() + digits.size(), value)};
    if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
        throw invalid_job_id();
    }
    return value;
}

std::string ProofServiceClient::normalize_job_id(const nlohmann::json& result) {
    if (result.is_string()) {
        return result.get<std::string>();
    }
    if (result.is_number_unsigned()) {
        return std::to_string(result.get<uint64_t>());
    }
    if (result.is_number_integer()) {
        const auto value{result.get<int64_t>()};
        if (value < 0) {
            throw Error{ErrorCode::kMalformedResponse, absl::StrCat("negative job ID: ", value)};
        }
        return std::to_string(value);
    }
    if (result.is_number_float()) {
        // 2^64 is exactly representable, every double below it with no fraction fits uint64_t
        constexpr double kJobIdLimit{18446744073709551616.0};
        const auto value{result.get<double>()};
        if (!std::isfinite(value) || value < 0 || value >= kJobIdLimit || std::trunc(value) != value) {
            throw Error{ErrorCode::kMalformedResponse, absl::StrCat("job ID is not a 64-bit unsigned integer: ", result.dump())};
        }
        return std::to_string(static_cast<uint64_t>(value));
    }
    throw Error{ErrorCode::kMalformedResponse, absl::StrCat("unexpected result type: ", result.type_name())};
}

std::string ProofServiceClient::request_proof(ChainId chain_id, BlockNum block_num, uint32_t tx_index, uint32_t log_index) {
    LOGPROOF_DEBUG << "Requesting proof for chain_id=" << chain_id << " block_num=" << block_num
                   << " tx_index=" << tx_index << " log_index=" << log_index;
    nlohmann::json result;
    try {
        result = client_.call(kRequestProofMethod, nlohmann::json::array({chain_id, block_num, tx_index, log_index}));
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kSubmission, absl::StrCat(kRequestProofMethod, " failed at ", endpoint().to_string()), e);
    }
    std::string job_id;
    try {
        job_id = normalize_job_id(result);
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kSubmission,
                          absl::StrCat("failed to decode ", kRequestProofMethod, " result from ", endpoint().to_string()), e);
    }
    LOGPROOF_DEBUG << "Proof requested, job ID: " << job_id;
    return job_id;
}

std::string ProofServiceClient::request_proof(const chain::TransactionCoordinates& coordinates) {
    return request_proof(coordinates.chain_id, coordinates.block_num, coordinates.tx_index, coordinates.log_index);
}

ProofStatus ProofServiceClient::get_status(std::string_view job_id) {
    const auto job_number{parse_job_id(job_id)};
    nlohmann::json result;
    try {
        result = client_.call(kQueryProofMethod, nlohmann::json::array({job_number}));
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kSubmission, absl::StrCat(kQueryProofMethod, " failed at ", endpoint().to_string()), e);
    }
    try {
        return result.get<ProofStatus>();
    } catch (const Error& e) {
        throw Error::wrap(ErrorCode::kMalformedResponse,
                          absl::StrCat("failed to decode ", kQueryProofMethod, " result from ", endpoint().to_string()), e);
    }
}

void ProofServiceClient::check_interrupted(const WaitOptions& options) {
    if (options.stoppable && options.stoppable->is_stopping()) {
        throw Error{ErrorCode::kCancelled, "proof polling cancelled"};
    }
    if (options.deadline && std::chrono::steady_clock::now() >= *options.deadline) {
        throw Error{ErrorCode::kDeadlineExceeded, "proof polling deadline exceeded"};
    }
}

void ProofServiceClient::sleep(const WaitOptions& options, std::chrono::milliseconds duration) {
    if (options.deadline) {
        const auto remaining{std::chrono::duration_cast<std::chrono::milliseconds>(*options.deadline - std::chrono::steady_clock::now())};
        duration = std::clamp(remaining, std::chrono::milliseconds::zero(), duration);
    }
    if (sleep_) {
        sleep_(duration);
    } else if (options.stoppable) {
        options.stoppable->wait_for(duration);
    } else {
        std::this_thread::sleep_for(duration);
    }
}

ProofStatus ProofServiceClient::wait_for_proof(std::string_view job_id, const WaitOptions& options) {
    if (options.max_attempts <= 0) {
        throw Error{ErrorCode::kInvalidArgument, absl::StrCat("max attempts must be positive, got ", options.max_attempts)};
    }
    if (options.interval.count() < 0) {
        throw Error{ErrorCode::kInvalidArgument, absl::StrCat("poll interval must not be negative, got ", options.interval.count(), "ms")};
    }
    for (int attempt{1}; attempt <= options.max_attempts; ++attempt) {
        check_interrupted(options);
        LOGPROOF_DEBUG << "Polling attempt " << attempt << "/" << options.max_attempts << " for job " << job_id;

        auto status{get_status(job_id)};
        switch (status.state) {
            case ProofState::kCompleted:
                LOGPROOF_DEBUG << "Proof for job " << job_id << " is ready";
                return status;
            case ProofState::kFailed:
                throw Error{ErrorCode::kProofFailed, absl::StrCat("proof generation failed: ", status.error_message.value_or(""))};
            case ProofState::kPending:
            case ProofState::kProcessing:
                LOGPROOF_DEBUG << "Job status: " << status.status << ", waiting...";
                if (attempt < options.max_attempts) {
                    sleep(options, options.interval);
                }
                break;
            case ProofState::kUnknown:
                throw Error{ErrorCode::kUnknownStatus, absl::StrCat("unknown job status: ", status.status)};
        }
    }
    throw Error{ErrorCode::kPollingTimeout,
                absl::StrFormat("max polling attempts (%d) reached without completion", options.max_attempts)};
}

ProofStatus ProofServiceClient::wait_for_proof(std::string_view job_id) {
    return wait_for_proof(job_id, WaitOptions{.max_attempts = max_attempts_, .interval = poll_interval_});
}

}  // namespace logproof::prover
