// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "log.hpp"

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string_view>
#include <utility>

#include <absl/strings/str_cat.h>
#include <absl/time/clock.h>
#include <absl/time/time.h>

#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/terminal.hpp>

namespace logproof::log {

namespace {

    struct Sink {
        Settings settings;
        bool colored{false};
        std::unique_ptr<std::ofstream> file;
        std::mutex mutex;
    };

    Sink& sink() {
        static Sink instance;
        return instance;
    }

    std::pair<std::string_view, std::string_view> tag_of(Level level) {
        switch (level) {
            case Level::kCritical:
                return {" CRIT", terminal::kRedBackground};
            case Level::kError:
                return {"ERROR", terminal::kRed};
            case Level::kWarning:
                return {" WARN", terminal::kYellow};
            case Level::kInfo:
                return {" INFO", terminal::kGreen};
            case Level::kDebug:
                return {"DEBUG", terminal::kPurpleBackground};
            case Level::kTrace:
                return {"TRACE", terminal::kGrey};
        }
        return {"     ", terminal::kReset};
    }

    void write(Level level, const std::string& message) {
        auto& out{sink()};
        const auto [tag, color] = tag_of(level);
        const absl::TimeZone time_zone{out.settings.log_utc ? absl::UTCTimeZone() : absl::LocalTimeZone()};
        const auto prefix{absl::StrCat(" [", absl::FormatTime("%m-%d|%H:%M:%E3S", absl::Now(), time_zone), "] ")};

        std::scoped_lock lock{out.mutex};
        auto& console{out.settings.log_std_out ? std::cout : std::cerr};
        if (out.colored) {
            console << color << tag << terminal::kReset;
        } else {
            console << tag;
        }
        console << prefix << message << '\n';
        if (out.file) {
            *out.file << tag << prefix << message << std::endl;
        }
    }

}  // namespace

void init(const Settings& settings) {
    auto& out{sink()};
    std::scoped_lock lock{out.mutex};
    out.settings = settings;
    out.file.reset();
    if (!settings.log_file.empty()) {
        auto file{std::make_unique<std::ofstream>(settings.log_file, std::ios::out | std::ios::app)};
        if (!file->is_open()) {
            throw Error{ErrorCode::kInvalidConfig, absl::StrCat("cannot open log file ", settings.log_file)};
        }
        out.file = std::move(file);
    }
    terminal::enable_escape_sequences();
    out.colored = !settings.log_nocolor && terminal::is_tty(settings.log_std_out ? stdout : stderr);
}

Level get_verbosity() { return sink().settings.log_verbosity; }

void set_verbosity(Level level) { sink().settings.log_verbosity = level; }

bool test_verbosity(Level level) { return level <= sink().settings.log_verbosity; }

Line::Line(Level level) : level_{level}, enabled_{test_verbosity(level)} {}

Line::~Line() {
    if (enabled_) {
        write(level_, stream_.str());
    }
}

}  // namespace logproof::log
