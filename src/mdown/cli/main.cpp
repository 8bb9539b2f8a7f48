// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/cli/commands.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <exception>
#include <iostream>

using namespace mdown::cli;

int main(int argc, char* argv[]) {
    // Logs go to stderr so the progress line owns stdout
    auto logger = spdlog::stderr_color_mt("mdown");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    try {
        auto args = parse_args(argc, argv);
        if (!args) {
            std::cerr << "Use -h for help" << std::endl;
            return 1;
        }

        if (args->help) {
            print_help(argv[0]);
            return 0;
        }
        if (args->version) {
            print_version();
            return 0;
        }

        if (args->url.empty()) {
            spdlog::error("No url given.");
            std::cerr << "Use -h for help" << std::endl;
            return 1;
        }

        auto config = resolve_config(*args);
        if (!config) {
            return 1;
        }

        auto result = args->info ? info(*args, *config) : download(*args, *config);
        return result ? *result : 1;
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return 1;
    }
}
