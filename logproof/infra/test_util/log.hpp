// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <iostream>
#include <sstream>
#include <string>

#include <logproof/infra/common/log.hpp>

namespace logproof::test_util {

//! Redirects std::cout and std::cerr into buffers and configures the logger for the lifetime of the object
//! \details Restores the console streams and the default logger configuration on destruction
class LogCapture {
  public:
    explicit LogCapture(log::Settings settings = {.log_nocolor = true})
        : cout_buffer_{std::cout.rdbuf(out_.rdbuf())}, cerr_buffer_{std::cerr.rdbuf(err_.rdbuf())} {
        log::init(settings);
    }
    ~LogCapture() {
        log::init({});
        std::cout.rdbuf(cout_buffer_);
        std::cerr.rdbuf(cerr_buffer_);
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::string out() const { return out_.str(); }
    std::string err() const { return err_.str(); }

  private:
    std::ostringstream out_;
    std::ostringstream err_;
    std::streambuf* cout_buffer_;
    std::streambuf* cerr_buffer_;
};

}  // namespace logproof::test_util
