// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdio>
#include <string_view>

namespace logproof::terminal {

// ANSI SGR sequences highlighting log level tags
inline constexpr std::string_view kReset{"\x1b[0m"};
inline constexpr std::string_view kGrey{"\x1b[90m"};
inline constexpr std::string_view kGreen{"\x1b[32m"};
inline constexpr std::string_view kYellow{"\x1b[1;33m"};
inline constexpr std::string_view kRed{"\x1b[91m"};
inline constexpr std::string_view kPurpleBackground{"\x1b[105m"};
inline constexpr std::string_view kRedBackground{"\x1b[101m"};

//! Switch the console to UTF-8 with escape sequence processing (only Windows needs it)
void enable_escape_sequences();

//! Whether the C stream is attached to a TTY
bool is_tty(std::FILE* stream);

}  // namespace logproof::terminal
