// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <catch2/catch_test_macros.hpp>

namespace logproof {

TEST_CASE("Environment") {
    SECTION("get env var") {
        CHECK(Environment::get("LOGPROOF_UNEXISTING_ENV_VAR").empty());
        CHECK_FALSE(Environment::get("PATH").empty());
    }

    SECTION("set/get env var") {
        Environment::set("LOGPROOF_TEST_API_KEY", "secret");
        CHECK(Environment::get("LOGPROOF_TEST_API_KEY") == "secret");
    }

    SECTION("home dir follows HOME") {
        const auto previous_home{Environment::get("HOME")};
        Environment::set("HOME", "/tmp/logproof-home");
        const auto home{Environment::get_home_dir()};
        REQUIRE(home.has_value());
        CHECK(*home == std::filesystem::path{"/tmp/logproof-home"});
        Environment::set("HOME", previous_home);
    }
}

}  // namespace logproof
