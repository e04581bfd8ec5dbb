// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/cli/commands.hpp>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace folio::cli;

// Terminate handler to catch exceptions in noexcept functions
static void folio_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto eptr = std::current_exception()) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

extern "C" void folio_sigint_handler(int) {
    request_interrupt();
}

int main(int argc, char* argv[]) {
    std::set_terminate(folio_terminate_handler);

    CliArgs args = parse_args(argc, argv);

    if (args.help) {
        print_help(argv[0]);
        return 0;
    }

    if (args.version) {
        print_version();
        return 0;
    }

    if (!args.error.empty()) {
        std::cerr << "Error: " << args.error << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    if (args.manifest.empty()) {
        std::cerr << "Error: No manifest specified" << std::endl;
        std::cout << "Use -h for help" << std::endl;
        return 1;
    }

    configure_logging(args);

    if (args.list_only) {
        auto result = info(args);
        return result ? *result : 1;
    }

    std::signal(SIGINT, folio_sigint_handler);

    auto result = download(args);
    return result ? *result : 1;
}
