// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "stoppable.hpp"

#include <chrono>
#include <thread>

#include <catch2/catch_test_macros.hpp>

namespace logproof {

using namespace std::chrono_literals;

TEST_CASE("Stoppable") {
    Stoppable stoppable{};
    REQUIRE(stoppable.is_stopping() == false);
    REQUIRE(stoppable.stop() == true);
    REQUIRE(stoppable.stop() == false);
    REQUIRE(stoppable.is_stopping() == true);
}

TEST_CASE("Stoppable::wait_for") {
    Stoppable stoppable{};

    SECTION("elapses when no stop is requested") {
        const auto start{std::chrono::steady_clock::now()};
        CHECK_FALSE(stoppable.wait_for(20ms));
        CHECK(std::chrono::steady_clock::now() - start >= 20ms);
    }

    SECTION("returns immediately when already stopping") {
        stoppable.stop();
        const auto start{std::chrono::steady_clock::now()};
        CHECK(stoppable.wait_for(10s));
        CHECK(std::chrono::steady_clock::now() - start < 1s);
    }

    SECTION("wakes up on stop request from another thread") {
        std::thread stopper{[&]() {
            std::this_thread::sleep_for(20ms);
            stoppable.stop();
        }};
        const auto start{std::chrono::steady_clock::now()};
        CHECK(stoppable.wait_for(10s));
        CHECK(std::chrono::steady_clock::now() - start < 5s);
        stopper.join();
    }
}

}  // namespace logproof
