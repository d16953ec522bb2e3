// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "client.hpp"

#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <gmock/gmock.h>

#include <logproof/infra/common/error.hpp>
#include <logproof/rpc/test_util/mock_transport.hpp>

namespace logproof::prover {

using namespace std::chrono_literals;
using rpc::test_util::json_rpc_error;
using rpc::test_util::json_rpc_result;
using rpc::test_util::MockTransport;
using testing::_;
using testing::Return;
using testing::SaveArg;

static rpc::http::Response status_reply(const std::string& status) {
    return json_rpc_result({{"status", status}});
}

//! Fixture recording every sleep requested by the polling loop
struct ProofServiceClientTest {
    ProofServiceClientTest() {
        settings.api_key = "test-key";
        settings.max_attempts = 5;
        settings.poll_interval = 10ms;
        auto mock_transport{std::make_unique<MockTransport>("https://proof.testnet.polymer.zone")};
        transport = mock_transport.get();
        client = std::make_unique<ProofServiceClient>(settings, std::move(mock_transport),
                                                      [this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    Settings settings;
    MockTransport* transport{nullptr};
    std::unique_ptr<ProofServiceClient> client;
    std::vector<std::chrono::milliseconds> sleeps;
};

template <typename F>
static Error catch_error(F&& f) {
    try {
        f();
    } catch (const Error& e) {
        return e;
    }
    FAIL("no error raised");
    return Error{ErrorCode::kInvalidArgument, "unreachable"};
}

TEST_CASE("ProofServiceClient::parse_job_id", "[prover][client]") {
    CHECK(ProofServiceClient::parse_job_id("12345") == 12345);
    CHECK(ProofServiceClient::parse_job_id("0") == 0);
    CHECK(ProofServiceClient::parse_job_id("12345.0") == 12345);
    CHECK(ProofServiceClient::parse_job_id("12345.") == 12345);
    for (const auto invalid : {"", "abc", "12a", "-1", "1.5", " 1", "0x10", ".0"}) {
        CAPTURE(invalid);
        const auto error{catch_error([&]() { ProofServiceClient::parse_job_id(invalid); })};
        CHECK(error.code() == ErrorCode::kInvalidJobId);
        CHECK(error.kind() == ErrorKind::kValidation);
    }
}

TEST_CASE("ProofServiceClient::normalize_job_id", "[prover][client]") {
    CHECK(ProofServiceClient::normalize_job_id("12345") == "12345");
    CHECK(ProofServiceClient::normalize_job_id(12345.0) == "12345");
    CHECK(ProofServiceClient::normalize_job_id(12345) == "12345");
    CHECK(ProofServiceClient::normalize_job_id(uint64_t{18446744073709551615u}) == "18446744073709551615");
    const auto error{catch_error([]() { ProofServiceClient::normalize_job_id(nlohmann::json::object()); })};
    CHECK(error.code() == ErrorCode::kMalformedResponse);
    CHECK(error.kind() == ErrorKind::kDecode);

    SECTION("numbers outside the job ID range") {
        for (const auto& result : {nlohmann::json(1e20), nlohmann::json(-1), nlohmann::json(-3.0), nlohmann::json(12.5),
                                   nlohmann::json(18446744073709551616.0)}) {
            CHECK_THROWS_AS(ProofServiceClient::normalize_job_id(result), Error);
        }
    }

    SECTION("every normalized number is a valid job ID") {
        for (const auto& result : {nlohmann::json(0.0), nlohmann::json(9007199254740992.0),
                                   nlohmann::json(18446744073709549568.0), nlohmann::json(42)}) {
            const auto job_id{ProofServiceClient::normalize_job_id(result)};
            CHECK_NOTHROW(ProofServiceClient::parse_job_id(job_id));
        }
        CHECK(ProofServiceClient::normalize_job_id(18446744073709549568.0) == "18446744073709549568");
    }
}

TEST_CASE_METHOD(ProofServiceClientTest, "ProofServiceClient::request_proof", "[prover][client]") {
    SECTION("sends coordinates with bearer token") {
        std::string body;
        rpc::http::Headers headers;
        EXPECT_CALL(*transport, post(_, _))
            .WillOnce(testing::DoAll(SaveArg<0>(&body), SaveArg<1>(&headers), Return(json_rpc_result("777"))));
        CHECK(client->request_proof(8453, 123456, 7, 2) == "777");

        const auto request{nlohmann::json::parse(body)};
        CHECK(request["jsonrpc"] == "2.0");
        CHECK(request["id"] == 1);
        CHECK(request["method"] == "log_requestProof");
        CHECK(request["params"] == nlohmann::json::array({8453, 123456, 7, 2}));
        CHECK(testing::Matches(testing::Contains(testing::Pair("Authorization", "Bearer test-key")))(headers));
    }

    SECTION("numeric and string results normalize to the same job ID") {
        EXPECT_CALL(*transport, post(_, _))
            .WillOnce(Return(rpc::http::Response{200, R"({"jsonrpc":"2.0","id":1,"result":12345.0})"}))
            .WillOnce(Return(json_rpc_result("12345")));
        const chain::TransactionCoordinates coordinates{.chain_id = 1, .block_num = 2, .tx_index = 3, .log_index = 4};
        CHECK(client->request_proof(coordinates) == "12345");
        CHECK(client->request_proof(coordinates) == "12345");
    }

    SECTION("HTTP failure is a submission error") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(rpc::http::Response{401, "unauthorized"}));
        const auto error{catch_error([&]() { client->request_proof(1, 2, 3, 4); })};
        CHECK(error.code() == ErrorCode::kSubmission);
        CHECK(error.kind() == ErrorKind::kProtocol);
        CHECK(std::string{error.what()}.find("log_requestProof failed at https://proof.testnet.polymer.zone:443/") == 0);
        CHECK(error.cause());
    }

    SECTION("JSON-RPC error payload is a submission error") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(json_rpc_error(-32602, "invalid params")));
        const auto error{catch_error([&]() { client->request_proof(1, 2, 3, 4); })};
        CHECK(error.code() == ErrorCode::kSubmission);
        CHECK(std::string{error.what()}.find("invalid params") != std::string::npos);
    }

    SECTION("transport failure is a submission error") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(testing::Throw(Error{ErrorCode::kTransport, "connection refused"}));
        const auto error{catch_error([&]() { client->request_proof(1, 2, 3, 4); })};
        CHECK(error.code() == ErrorCode::kSubmission);
        CHECK(error.kind() == ErrorKind::kTransport);
    }

    SECTION("unexpected result type") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(json_rpc_result(true)));
        const auto error{catch_error([&]() { client->request_proof(1, 2, 3, 4); })};
        CHECK(error.code() == ErrorCode::kSubmission);
        CHECK(error.kind() == ErrorKind::kDecode);
        CHECK(std::string{error.what()}.find("failed to decode log_requestProof result from https://proof.testnet.polymer.zone:443/") == 0);
    }

    SECTION("job ID beyond 64 bits") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(json_rpc_result(1e20)));
        const auto error{catch_error([&]() { client->request_proof(1, 2, 3, 4); })};
        CHECK(error.code() == ErrorCode::kSubmission);
        CHECK(error.kind() == ErrorKind::kDecode);
        CHECK(std::string{error.what()}.find("log_requestProof") != std::string::npos);
    }
}

TEST_CASE_METHOD(ProofServiceClientTest, "ProofServiceClient::get_status", "[prover][client]") {
    SECTION("job ID is sent as a number") {
        std::string body;
        EXPECT_CALL(*transport, post(_, _))
            .WillOnce(testing::DoAll(SaveArg<0>(&body),
                                     Return(json_rpc_result({{"status", "complete"}, {"proof", "AAEC"}}))));
        const auto status{client->get_status("12345")};
        CHECK(status.state == ProofState::kCompleted);
        REQUIRE(status.proof);
        CHECK(*status.proof == "AAEC");

        const auto request{nlohmann::json::parse(body)};
        CHECK(request["method"] == "log_queryProof");
        REQUIRE(request["params"].size() == 1);
        CHECK(request["params"][0].is_number());
        CHECK(request["params"][0] == 12345);
    }

    SECTION("invalid job ID issues no call") {
        EXPECT_CALL(*transport, post(_, _)).Times(0);
        const auto error{catch_error([&]() { client->get_status("job-1"); })};
        CHECK(error.code() == ErrorCode::kInvalidJobId);
    }

    SECTION("malformed status payload") {
        EXPECT_CALL(*transport, post(_, _)).WillOnce(Return(json_rpc_result("pending")));
        const auto error{catch_error([&]() { client->get_status("1"); })};
        CHECK(error.code() == ErrorCode::kMalformedResponse);
        CHECK(error.kind() == ErrorKind::kDecode);
        CHECK(std::string{error.what()}.find("failed to decode log_queryProof result from https://proof.testnet.polymer.zone:443/") == 0);
        CHECK(error.cause());
    }
}

TEST_CASE_METHOD(ProofServiceClientTest, "ProofServiceClient::wait_for_proof", "[prover][client]") {
    const WaitOptions options{.max_attempts = 5, .interval = 250ms};

    SECTION("pending, pending, completed: 3 observations and 2 sleeps") {
        EXPECT_CALL(*transport, post(_, _))
            .Times(3)
            .WillOnce(Return(status_reply("pending")))
            .WillOnce(Return(status_reply("pending")))
            .WillOnce(Return(json_rpc_result({{"status", "completed"}, {"proof", "AAEC"}})));
        const auto status{client->wait_for_proof("42", options)};
        CHECK(status.state == ProofState::kCompleted);
        REQUIRE(status.proof);
        CHECK(*status.proof == "AAEC");
        CHECK(sleeps == std::vector<std::chrono::milliseconds>{250ms, 250ms});
    }

    SECTION("processing is a synonym of pending and complete of completed") {
        EXPECT_CALL(*transport, post(_, _))
            .Times(2)
            .WillOnce(Return(status_reply("processing")))
            .WillOnce(Return(status_reply("complete")));
        CHECK(client->wait_for_proof("42", options).status == "complete");
        CHECK(sleeps.size() == 1);
    }

    SECTION("all pending exhausts attempts without sleeping after the last one") {
        EXPECT_CALL(*transport, post(_, _)).Times(3).WillRepeatedly(Return(status_reply("pending")));
        const auto error{catch_error([&]() { client->wait_for_proof("42", WaitOptions{.max_attempts = 3, .interval = 250ms}); })};
        CHECK(error.code() == ErrorCode::kPollingTimeout);
        CHECK(error.kind() == ErrorKind::kTimeout);
        CHECK(std::string{error.what()} == "max polling attempts (3) reached without completion");
        CHECK(sleeps.size() == 2);
    }

    SECTION("failed on first attempt returns immediately") {
        EXPECT_CALL(*transport, post(_, _))
            .Times(1)
            .WillOnce(Return(json_rpc_result({{"status", "failed"}, {"error", "receipt not found"}})));
        const auto error{catch_error([&]() { client->wait_for_proof("42", options); })};
        CHECK(error.code() == ErrorCode::kProofFailed);
        CHECK(error.kind() == ErrorKind::kDomain);
        CHECK(std::string{error.what()} == "proof generation failed: receipt not found");
        CHECK(sleeps.empty());
    }

    SECTION("unknown status is terminal") {
        EXPECT_CALL(*transport, post(_, _))
            .Times(2)
            .WillOnce(Return(status_reply("pending")))
            .WillOnce(Return(status_reply("expired")));
        const auto error{catch_error([&]() { client->wait_for_proof("42", options); })};
        CHECK(error.code() == ErrorCode::kUnknownStatus);
        CHECK(std::string{error.what()} == "unknown job status: expired");
        CHECK(sleeps.size() == 1);
    }

    SECTION("errors from get_status are not retried") {
        EXPECT_CALL(*transport, post(_, _)).Times(1).WillOnce(Return(rpc::http::Response{500, "internal error"}));
        const auto error{catch_error([&]() { client->wait_for_proof("42", options); })};
        CHECK(error.code() == ErrorCode::kSubmission);
        CHECK(sleeps.empty());
    }

    SECTION("stop request before polling cancels") {
        Stoppable stoppable;
        stoppable.stop();
        EXPECT_CALL(*transport, post(_, _)).Times(0);
        const auto error{catch_error([&]() { client->wait_for_proof("42", WaitOptions{.max_attempts = 5, .interval = 250ms, .stoppable = &stoppable}); })};
        CHECK(error.code() == ErrorCode::kCancelled);
        CHECK(error.kind() == ErrorKind::kTimeout);
    }

    SECTION("stop request during sleep cancels next attempt") {
        Stoppable stoppable;
        auto mock_transport{std::make_unique<MockTransport>()};
        EXPECT_CALL(*mock_transport, post(_, _)).Times(1).WillOnce(Return(status_reply("pending")));
        ProofServiceClient stopping_client{settings, std::move(mock_transport), [&](std::chrono::milliseconds) { stoppable.stop(); }};
        const auto error{catch_error([&]() { stopping_client.wait_for_proof("42", WaitOptions{.max_attempts = 5, .interval = 250ms, .stoppable = &stoppable}); })};
        CHECK(error.code() == ErrorCode::kCancelled);
    }

    SECTION("deadline already passed") {
        EXPECT_CALL(*transport, post(_, _)).Times(0);
        const WaitOptions expired{.max_attempts = 5, .interval = 250ms, .deadline = std::chrono::steady_clock::now() - 1ms};
        const auto error{catch_error([&]() { client->wait_for_proof("42", expired); })};
        CHECK(error.code() == ErrorCode::kDeadlineExceeded);
        CHECK(error.kind() == ErrorKind::kTimeout);
    }

    SECTION("sleep is clipped to deadline") {
        EXPECT_CALL(*transport, post(_, _)).WillRepeatedly(Return(status_reply("pending")));
        const WaitOptions bounded{.max_attempts = 5, .interval = 1h, .deadline = std::chrono::steady_clock::now() + 50ms};
        // Injected sleep returns immediately so the deadline is not reached by the loop itself
        CHECK_THROWS_AS(client->wait_for_proof("42", bounded), Error);
        REQUIRE_FALSE(sleeps.empty());
        CHECK(sleeps.front() <= 50ms);
    }

    SECTION("non-positive attempts rejected") {
        EXPECT_CALL(*transport, post(_, _)).Times(0);
        const auto error{catch_error([&]() { client->wait_for_proof("42", WaitOptions{.max_attempts = 0, .interval = 250ms}); })};
        CHECK(error.code() == ErrorCode::kInvalidArgument);
    }

    SECTION("defaults from settings") {
        EXPECT_CALL(*transport, post(_, _)).Times(5).WillRepeatedly(Return(status_reply("pending")));
        const auto error{catch_error([&]() { client->wait_for_proof("42"); })};
        CHECK(error.code() == ErrorCode::kPollingTimeout);
        CHECK(sleeps == std::vector<std::chrono::milliseconds>(4, 10ms));
    }
}

}  // namespace logproof::prover
