// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include <logproof/chain/settings.hpp>
#include <logproof/core/common/base.hpp>
#include <logproof/infra/common/log.hpp>
#include <logproof/prover/settings.hpp>

namespace logproof::cli {

//! Subcommands, enumerator names are the command-line names
enum class Command {
    request,
    status,
    version,
};

struct RequestOptions {
    // Explicit coordinates
    std::optional<ChainId> chain_id;
    std::optional<BlockNum> block_num;
    std::optional<uint32_t> tx_index;
    std::optional<uint32_t> log_index;

    // Transaction hash lookup
    std::optional<std::string> tx_hash;
    std::optional<std::string> event_signature;
    chain::ResolverSettings resolver_settings;

    bool wait{false};
    bool raw{false};
};

struct StatusOptions {
    std::string job_id;
    bool raw{false};
};

struct Options {
    prover::Settings settings;
    Command command{Command::version};
    RequestOptions request;
    StatusOptions status;
};

//! \brief Set up options to populate log settings after cli.parse()
void add_logging_options(CLI::App& cli, log::Settings& log_settings);

//! \brief Define all options, parse the command line and post-process settings
//! \details Precedence is command-line flag, then config file (TOML), then LOGPROOF_* environment variable, then default
void parse_command_line(int argc, char* argv[], CLI::App& app, Options& options);

}  // namespace logproof::cli
