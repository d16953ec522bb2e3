// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace logproof {

class Environment {
  public:
    //! Value of the given environment variable, empty if not set
    static std::string get(std::string_view var_name);

    static void set(std::string_view var_name, std::string_view value);

    //! The user home directory, if it can be determined
    static std::optional<std::filesystem::path> get_home_dir();
};

}  // namespace logproof
