// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include "options.hpp"

#include <map>

#include <magic_enum.hpp>

#include <logproof/infra/common/environment.hpp>

namespace logproof::cli {

static constexpr const char* kDefaultConfigFileName{".logproof.toml"};

void add_logging_options(CLI::App& cli, log::Settings& log_settings) {
    std::map<std::string, log::Level> level_mapping{
        {"critical", log::Level::kCritical},
        {"error", log::Level::kError},
        {"warning", log::Level::kWarning},
        {"info", log::Level::kInfo},
        {"debug", log::Level::kDebug},
        {"trace", log::Level::kTrace},
    };
    auto& log_opts = *cli.add_option_group("Log", "Logging options");
    log_opts.add_option("--log.verbosity", log_settings.log_verbosity, "Sets log verbosity")
        ->check(CLI::Range(log::Level::kCritical, log::Level::kTrace))
        ->transform(CLI::Transformer(level_mapping, CLI::ignore_case))
        ->default_val(log::Level::kWarning);
    log_opts.add_flag("--log.stdout", log_settings.log_std_out, "Outputs to std::out instead of std::err");
    log_opts.add_flag("--log.nocolor", log_settings.log_nocolor, "Disable colors on log lines");
    log_opts.add_flag("--log.utc", log_settings.log_utc, "Prints log timings in UTC");
    log_opts.add_option("--log.file", log_settings.log_file, "Tee all log lines to given file name");
}

static void add_request_options(CLI::App& cmd, RequestOptions& options) {
    auto& coordinates = *cmd.add_option_group("Coordinates", "Explicit log coordinates");
    coordinates.add_option("--chain-id", options.chain_id, "Source chain ID (fallback when the transaction carries none)");
    coordinates.add_option("--block-number", options.block_num, "Source block number");
    coordinates.add_option("--tx-index", options.tx_index, "Transaction index in the block");
    coordinates.add_option("--log-index", options.log_index, "Log index in the transaction");

    auto& lookup = *cmd.add_option_group("Lookup", "Transaction hash lookup");
    lookup.add_option("--tx-hash", options.tx_hash, "Transaction hash to request proof for");
    lookup.add_option("--rpc-url", options.resolver_settings.rpc_url, "RPC URL for the blockchain")
        ->envname("LOGPROOF_RPC_URL");
    lookup.add_option("--event-signature", options.event_signature,
                      "Event signature to identify the log (e.g. 'Transfer(address,address,uint256)')");

    cmd.add_flag("--wait", options.wait, "Wait for the proof to be generated");
    cmd.add_flag("--raw", options.raw, "Return raw JSON output");
}

void parse_command_line(int argc, char* argv[], CLI::App& app, Options& options) {
    auto& settings = options.settings;

    std::string default_config_file;
    if (const auto home_dir{Environment::get_home_dir()}; home_dir) {
        default_config_file = (*home_dir / kDefaultConfigFileName).string();
    }
    app.set_config("--config", default_config_file, "Config file (TOML)", /*config_required=*/false);

    app.add_option("--api-key", settings.api_key, "Proof service API key")
        ->envname("LOGPROOF_API_KEY");
    app.add_option("--api-url", settings.api_url, "Proof service API URL")
        ->envname("LOGPROOF_API_URL")
        ->capture_default_str();
    app.add_flag("--debug", settings.debug, "Enable debug logging")
        ->envname("LOGPROOF_DEBUG");
    app.add_option("--max-attempts", settings.max_attempts, "Maximum number of polling attempts")
        ->envname("LOGPROOF_MAX_ATTEMPTS")
        ->capture_default_str();
    int64_t interval_ms{settings.poll_interval.count()};
    app.add_option("--interval", interval_ms, "Polling interval in milliseconds")
        ->envname("LOGPROOF_INTERVAL")
        ->capture_default_str();
    add_logging_options(app, settings.log_settings);

    // Global options are also accepted after the subcommand name
    app.fallthrough();

    std::map<Command, CLI::App*> commands;
    for (const auto& [command, name] : magic_enum::enum_entries<Command>()) {
        commands[command] = app.add_subcommand(std::string{name});
    }
    app.require_subcommand(1);

    auto& request_cmd = *commands[Command::request];
    request_cmd.description("Request a new proof for a transaction log");
    add_request_options(request_cmd, options.request);

    auto& status_cmd = *commands[Command::status];
    status_cmd.description("Check the status of a proof generation job");
    status_cmd.add_option("job-id", options.status.job_id, "Job ID returned when the proof was requested")
        ->required();
    status_cmd.add_flag("--raw", options.status.raw, "Return raw JSON output");

    commands[Command::version]->description("Print the version number");

    app.parse(argc, argv);

    const auto command_name{app.get_subcommands().front()->get_name()};
    options.command = magic_enum::enum_cast<Command>(command_name).value();

    settings.poll_interval = std::chrono::milliseconds{interval_ms};
    options.request.resolver_settings.http_timeout = settings.http_timeout;
    if (settings.debug && settings.log_settings.log_verbosity < log::Level::kDebug) {
        settings.log_settings.log_verbosity = log::Level::kDebug;
    }
}

}  // namespace logproof::cli
