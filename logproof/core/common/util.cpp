// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "util.hpp"

#include <algorithm>
#include <cctype>

#include <ethash/keccak.hpp>

namespace logproof {

bool is_valid_hex(std::string_view s) {
    const auto digits{strip_hex_prefix(s)};
    if (digits.empty()) {
        return false;
    }
    return std::all_of(digits.cbegin(), digits.cend(), [](char c) { return std::isxdigit(static_cast<unsigned char>(c)) != 0; });
}

std::string to_hex(ByteView bytes, bool with_prefix) {
    static const char* kHexDigits{"0123456789abcdef"};
    std::string out(bytes.length() * 2 + (with_prefix ? 2 : 0), '\0');
    char* dest{&out[0]};
    if (with_prefix) {
        *dest++ = '0';
        *dest++ = 'x';
    }
    for (const auto& b : bytes) {
        *dest++ = kHexDigits[b >> 4];    // Hi
        *dest++ = kHexDigits[b & 0x0f];  // Lo
    }
    return out;
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept {
    if (ch >= '0' && ch <= '9') {
        return static_cast<uint8_t>(ch - '0');
    }
    if (ch >= 'a' && ch <= 'f') {
        return static_cast<uint8_t>(ch - 'a' + 10);
    }
    if (ch >= 'A' && ch <= 'F') {
        return static_cast<uint8_t>(ch - 'A' + 10);
    }
    return std::nullopt;
}

std::optional<Bytes> from_hex(std::string_view hex) noexcept {
    hex = strip_hex_prefix(hex);
    if (hex.empty()) {
        return Bytes{};
    }

    const size_t pos(hex.length() & 1);  // "[0x]1" is legit and has to be treated as "[0x]01"
    Bytes out((hex.length() + pos) / 2, '\0');
    const char* src{hex.data()};
    const char* last = src + hex.length();
    uint8_t* dst{&out[pos]};

    if (pos) {
        auto lo{decode_hex_digit(*src++)};
        if (!lo) return std::nullopt;
        out[0] = *lo;
    }

    // following "while" is unrolling the loop when we have >= 4 target bytes
    // this is optional, but 5-10% faster
    while (last - src >= 8) {
        auto hi{decode_hex_digit(*src++)};
        auto lo{decode_hex_digit(*src++)};
        auto hi1{decode_hex_digit(*src++)};
        auto lo1{decode_hex_digit(*src++)};
        auto hi2{decode_hex_digit(*src++)};
        auto lo2{decode_hex_digit(*src++)};
        auto hi3{decode_hex_digit(*src++)};
        auto lo3{decode_hex_digit(*src++)};
        if (!hi || !lo || !hi1 || !lo1 || !hi2 || !lo2 || !hi3 || !lo3) return std::nullopt;
        *dst++ = static_cast<uint8_t>(*hi << 4 | *lo);
        *dst++ = static_cast<uint8_t>(*hi1 << 4 | *lo1);
        *dst++ = static_cast<uint8_t>(*hi2 << 4 | *lo2);
        *dst++ = static_cast<uint8_t>(*hi3 << 4 | *lo3);
    }

    // no need to check for last - src >= 2 as we know hex.length() is even
    while (src < last) {
        auto hi{decode_hex_digit(*src++)};
        auto lo{decode_hex_digit(*src++)};
        if (!hi || !lo) return std::nullopt;
        *dst++ = static_cast<uint8_t>(*hi << 4 | *lo);
    }
    return out;
}

std::string abridge(std::string_view input, size_t length) {
    if (input.length() <= length) {
        return std::string(input);
    }
    return std::string(input.substr(0, length)) + "...";
}

inline bool case_insensitive_char_comparer(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool iequals(const std::string_view a, const std::string_view b) {
    return (a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), case_insensitive_char_comparer));
}

Hash keccak256(ByteView view) {
    const ethash::hash256 digest{ethash::keccak256(view.data(), view.size())};
    Hash hash;
    std::copy(std::begin(digest.bytes), std::end(digest.bytes), hash.begin());
    return hash;
}

Hash keccak256(std::string_view text) {
    return keccak256(ByteView{reinterpret_cast<const uint8_t*>(text.data()), text.size()});
}

}  // namespace logproof
