// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace logproof::prover {

//! Proof as printed for scripts: the bare value of a JSON string, the compact JSON text otherwise
std::string render_raw(const nlohmann::json& proof);

//! Proof as printed for humans: JSON indented by two spaces
std::string render_pretty(const nlohmann::json& proof);

}  // namespace logproof::prover
