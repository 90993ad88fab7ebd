// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/cli/commands.hpp>
#include <spool/core/cache_engine.hpp>
#include <spool/version.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdlib>
#include <exception>
#include <iostream>

using namespace spool::cli;

// Terminate handler to catch exceptions in noexcept functions
static void spool_terminate_handler() {
    static bool in_terminate = false;
    if (in_terminate) {
        std::abort();  // Prevent re-entrant abort
    }
    in_terminate = true;

    std::cerr << "FATAL: std::terminate called!" << std::endl;
    if (auto active = std::current_exception()) {
        try {
            std::rethrow_exception(active);
        } catch (const std::exception& e) {
            std::cerr << "Exception: " << e.what() << std::endl;
        } catch (...) {
            std::cerr << "Unknown exception in noexcept context" << std::endl;
        }
    }
    std::cerr << "Aborting..." << std::endl;
    std::abort();
}

static void setup_logging(const CliArgs& args) {
    // Logs go to stderr; stdout carries command output
    spdlog::set_default_logger(spdlog::stderr_color_mt("spool"));
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");

    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

static int run(const CliArgs& args) {
    switch (args.command) {
        case Command::get: {
            if (args.urls.size() != 1) {
                std::cerr << "Error: get takes exactly one URL" << std::endl;
                return 1;
            }
            return get(args.urls.front(), args).value_or(1);
        }
        case Command::status:
            if (args.urls.empty()) {
                std::cerr << "Error: No URL specified" << std::endl;
                return 1;
            }
            return status(args.urls, args).value_or(1);
        case Command::clear:
            return clear(args.urls, args).value_or(1);
        case Command::info: {
            int exit_code = 0;
            if (args.urls.empty()) {
                std::cerr << "Error: No URL specified" << std::endl;
                return 1;
            }
            for (const auto& url : args.urls) {
                if (!info(url, args)) exit_code = 1;
            }
            return exit_code;
        }
        case Command::none:
            break;
    }
    std::cerr << "Error: No command specified" << std::endl;
    std::cout << "Use -h for help" << std::endl;
    return 1;
}

int main(int argc, char* argv[]) {
    std::set_terminate(spool_terminate_handler);

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

    setup_logging(args);

    spool::core::CacheEngine::global_init();
    int exit_code = run(args);
    spool::core::CacheEngine::global_cleanup();
    return exit_code;
}
