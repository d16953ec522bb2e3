// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "terminal.hpp"

#if defined(_WIN32)
#include <io.h>
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace logproof::terminal {

void enable_escape_sequences() {
#if defined(_WIN32)
    SetConsoleOutputCP(CP_UTF8);
    for (const DWORD id : {STD_OUTPUT_HANDLE, STD_ERROR_HANDLE}) {
        const HANDLE console{GetStdHandle(id)};
        DWORD mode{0};
        if (console != INVALID_HANDLE_VALUE && GetConsoleMode(console, &mode)) {
            SetConsoleMode(console, mode | 0x0004 /* ENABLE_VIRTUAL_TERMINAL_PROCESSING */);
        }
    }
#endif
}

bool is_tty(std::FILE* stream) {
#if defined(_WIN32)
    return _isatty(_fileno(stream)) != 0;
#else
    return isatty(fileno(stream)) != 0;
#endif
}

}  // namespace logproof::terminal
