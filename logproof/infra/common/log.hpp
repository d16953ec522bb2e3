// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sstream>
#include <string>

namespace logproof::log {

//! Verbosity levels, from the most to the least severe
enum class Level {
    kCritical,
    kError,
    kWarning,  // Default: the command result is the only output
    kInfo,
    kDebug,  // --debug: request/response bodies, resolved coordinates, polling progress
    kTrace,  // Raw JSON handed to decoders, connection teardown
};

struct Settings {
    //! Console lines go to std::cout instead of std::cerr
    bool log_std_out{false};
    //! Timestamps in UTC instead of the local time zone
    bool log_utc{false};
    bool log_nocolor{false};
    Level log_verbosity{Level::kWarning};
    //! Also append every line to this file when not empty
    std::string log_file;
};

//! \brief Configure the process-wide log sink
//! \throws logproof::Error with code kInvalidConfig if the log file cannot be opened
//! \note Not thread safe, meant to be called from main before any logging
void init(const Settings& settings);

Level get_verbosity();

void set_verbosity(Level level);

//! Whether a line at this level would be written
bool test_verbosity(Level level);

//! \brief One log line, accumulated with operator<< and written out on destruction
class Line {
  public:
    explicit Line(Level level);
    ~Line();

    Line(const Line&) = delete;
    Line& operator=(const Line&) = delete;

    template <class T>
    Line& operator<<(const T& value) {
        if (enabled_) stream_ << value;
        return *this;
    }

  private:
    const Level level_;
    const bool enabled_;
    std::ostringstream stream_;
};

}  // namespace logproof::log

// Arguments are not evaluated when the level is disabled
#define LOGPROOF_LOG_AT(level_)                   \
    if (!logproof::log::test_verbosity(level_)) { \
    } else                                        \
        logproof::log::Line{level_}

#define LOGPROOF_TRACE LOGPROOF_LOG_AT(logproof::log::Level::kTrace)
#define LOGPROOF_DEBUG LOGPROOF_LOG_AT(logproof::log::Level::kDebug)
#define LOGPROOF_WARN LOGPROOF_LOG_AT(logproof::log::Level::kWarning)
