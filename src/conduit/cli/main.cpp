// Copyright (c) 2026 changcheng967. All rights reserved.

#include <conduit/cli/commands.hpp>
#include <conduit/core/logging.hpp>
#include <conduit/rpc/transport.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace conduit::cli;

// Report an escaped exception before aborting
static void conduit_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called" << std::endl;
    if (auto current = std::current_exception()) {
        try {
            std::rethrow_exception(current);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception" << std::endl;
        }
    }
    std::abort();
}

int main(int argc, char* argv[]) {
    std::set_terminate(conduit_terminate_handler);

    auto args = parse_args(argc, argv);
    if (!args) {
        std::cerr << "Error: " << args.error().message << std::endl;
        std::cerr << "Use -h for help" << std::endl;
        return 2;
    }

    if (args->help) {
        print_help(argv[0]);
        return 0;
    }
    if (args->version) {
        print_version();
        return 0;
    }

    auto settings = resolve_settings(*args);
    if (!settings) {
        std::cerr << "Error: " << settings.error().describe() << std::endl;
        return 2;
    }

    if (auto logging = conduit::core::init_logging(settings->log); !logging) {
        std::cerr << "Error: " << logging.error().describe() << std::endl;
        return 2;
    }

    if (auto curl = conduit::rpc::HttpTransport::global_init(); !curl) {
        std::cerr << "Error: " << curl.error().describe() << std::endl;
        return 1;
    }
    auto result = run(*args, *settings);
    conduit::rpc::HttpTransport::global_cleanup();

    if (!result) {
        std::cerr << "Error: " << result.error().describe() << std::endl;
        return 1;
    }
    return *result;
}
