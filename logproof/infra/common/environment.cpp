// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "environment.hpp"

#include <boost/process/environment.hpp>

namespace logproof {

std::string Environment::get(std::string_view var_name) {
    auto environment = boost::this_process::environment();
    const auto env_var = environment[std::string{var_name}];
    return env_var.to_string();
}

void Environment::set(std::string_view var_name, std::string_view value) {
    auto environment = boost::this_process::environment();
    environment[std::string{var_name}] = std::string{value};
}

std::optional<std::filesystem::path> Environment::get_home_dir() {
#ifdef _WIN32
    const auto home{get("USERPROFILE")};
#else
    const auto home{get("HOME")};
#endif
    if (home.empty()) {
        return std::nullopt;
    }
    return std::filesystem::path{home};
}

}  // namespace logproof
