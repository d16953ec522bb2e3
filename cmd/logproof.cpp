// Copyright 2025 The Logproof Authors
// SPDX-License-Identifier: Apache-2.0

#include <exception>
#include <iostream>

#include <CLI/CLI.hpp>
#include <boost/process/environment.hpp>

#include <logproof/cli/commands.hpp>
#include <logproof/cli/options.hpp>
#include <logproof/infra/common/error.hpp>
#include <logproof/infra/common/log.hpp>
#include <logproof/infra/concurrency/signal_handler.hpp>
#include <logproof/infra/concurrency/stoppable.hpp>
#include <logproof/prover/client.hpp>

using namespace logproof;
using namespace logproof::cli;

int main(int argc, char* argv[]) {
    CLI::App app{"Request proofs of blockchain transaction logs from a remote proving service"};

    try {
        Options options;
        parse_command_line(argc, argv, app, options);

        log::init(options.settings.log_settings);

        const auto pid = boost::this_process::get_id();
        LOGPROOF_DEBUG << "logproof v" << version() << " starting [pid=" << std::to_string(pid) << "]";

        if (options.command == Command::version) {
            run_version(std::cout);
            return 0;
        }

        options.settings.validate();

        SignalHandler::init();
        Stoppable stop_source;

        prover::ProofServiceClient client{options.settings};
        switch (options.command) {
            case Command::request:
                run_request(options.request, options.settings, client, make_resolver_factory(), &stop_source, std::cout);
                break;
            case Command::status:
                run_status(options.status, options.settings, client, std::cout);
                break;
            case Command::version:
                break;
        }

        LOGPROOF_DEBUG << "logproof exiting [pid=" << std::to_string(pid) << "]";
        return 0;
    } catch (const CLI::ParseError& pe) {
        return app.exit(pe);
    } catch (const Error& e) {
        LOGPROOF_DEBUG << "logproof failed [kind=" << e.kind() << " code=" << e.code() << "]";
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
