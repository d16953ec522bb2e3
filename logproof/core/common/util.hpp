// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

#include <logproof/core/common/base.hpp>

namespace logproof {

using Hash = std::array<uint8_t, kHashLength>;

inline bool has_hex_prefix(std::string_view s) {
    return s.length() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X');
}

//! \brief Strips the 0x/0X prefix if present
inline std::string_view strip_hex_prefix(std::string_view s) {
    return has_hex_prefix(s) ? s.substr(2) : s;
}

//! \brief Whether the string is a non-empty sequence of hex digits, optionally 0x-prefixed
bool is_valid_hex(std::string_view s);

//! \brief Returns a string representing the hex form of provided string of bytes
std::string to_hex(ByteView bytes, bool with_prefix = false);

inline std::string to_hex(const Hash& hash, bool with_prefix = false) {
    return to_hex(ByteView{hash.data(), hash.size()}, with_prefix);
}

std::optional<uint8_t> decode_hex_digit(char ch) noexcept;

std::optional<Bytes> from_hex(std::string_view hex) noexcept;

//! \brief Abridges a string to given length and eventually adds an ellipsis if input length is gt required length
std::string abridge(std::string_view input, size_t length);

// Compares two strings for equality with case insensitivity
bool iequals(std::string_view a, std::string_view b);

//! \brief Keccak-256 digest (the pre-standard SHA-3 variant used by Ethereum)
Hash keccak256(ByteView view);

//! \brief Keccak-256 digest of the bytes of a text string
Hash keccak256(std::string_view text);

}  // namespace logproof
