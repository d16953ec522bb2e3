// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "quantity.hpp"

#include <limits>
#include <string>

#include <absl/strings/str_format.h>
#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>
#include <catch2/generators/catch_generators_adapters.hpp>
#include <catch2/generators/catch_generators_random.hpp>
#include <catch2/generators/catch_generators_range.hpp>

#include <logproof/infra/common/error.hpp>

namespace logproof::rpc {

static ErrorCode error_code_of(std::string_view hex) {
    try {
        hex_to_uint64(hex);
    } catch (const Error& e) {
        return e.code();
    }
    FAIL("no error raised for " << hex);
    return ErrorCode::kInvalidArgument;
}

TEST_CASE("hex_to_uint64", "[rpc][common][quantity]") {
    SECTION("zero") {
        CHECK(hex_to_uint64("0x0") == 0);
        CHECK(hex_to_uint64("0x00") == 0);
        CHECK(hex_to_uint64("0") == 0);
    }

    SECTION("typical quantities") {
        CHECK(hex_to_uint64("0x1") == 1);
        CHECK(hex_to_uint64("0x1b4") == 436);
        CHECK(hex_to_uint64("0X1B4") == 436);
        CHECK(hex_to_uint64("1b4") == 436);
        CHECK(hex_to_uint64("0x0000000000000000000001b4") == 436);
        CHECK(hex_to_uint64("0xe4e1c0") == 15'000'000);
    }

    SECTION("64-bit boundary") {
        CHECK(hex_to_uint64("0xffffffffffffffff") == std::numeric_limits<uint64_t>::max());
        CHECK(error_code_of("0x10000000000000000") == ErrorCode::kOverflow);
        CHECK(error_code_of("0x1ffffffffffffffffffff") == ErrorCode::kOverflow);
    }

    SECTION("invalid input") {
        CHECK(error_code_of("") == ErrorCode::kInvalidHex);
        CHECK(error_code_of("0x") == ErrorCode::kInvalidHex);
        CHECK(error_code_of("0xzz") == ErrorCode::kInvalidHex);
        CHECK(error_code_of("-0x1") == ErrorCode::kInvalidHex);
        CHECK(error_code_of(" 0x1") == ErrorCode::kInvalidHex);
    }

    SECTION("error kinds") {
        CHECK_THROWS_AS(hex_to_uint64("0xgg"), Error);
        try {
            hex_to_uint64("0x10000000000000000");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::kValidation);
        }
        try {
            hex_to_uint64("nothex");
        } catch (const Error& e) {
            CHECK(e.kind() == ErrorKind::kDecode);
        }
    }
}

static std::string format_quantity(uint64_t value, bool uppercase) {
    return uppercase ? absl::StrFormat("0x%X", value) : absl::StrFormat("0x%x", value);
}

TEST_CASE("hex_to_uint64 reads back formatted quantities", "[rpc][common][quantity]") {
    const auto uppercase = GENERATE(false, true);

    SECTION("powers of two and their predecessors") {
        const auto bit = GENERATE(range(0, 64));
        const uint64_t power{uint64_t{1} << bit};
        CHECK(hex_to_uint64(format_quantity(power, uppercase)) == power);
        CHECK(hex_to_uint64(format_quantity(power - 1, uppercase)) == power - 1);
    }

    SECTION("random values") {
        const auto value = GENERATE(take(100, random(uint64_t{0}, std::numeric_limits<uint64_t>::max())));
        CHECK(hex_to_uint64(format_quantity(value, uppercase)) == value);
    }
}

}  // namespace logproof::rpc
