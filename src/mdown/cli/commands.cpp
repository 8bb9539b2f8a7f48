// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/cli/commands.hpp>
#include <mdown/cli/progress_bar.hpp>
#include <mdown/core/curl_transport.hpp>
#include <mdown/core/download_coordinator.hpp>
#include <mdown/core/segment_store.hpp>
#include <mdown/core/settings.hpp>
#include <mdown/core/url.hpp>
#include <mdown/version.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <iostream>

namespace mdown::cli {

namespace {

// Accept "N" only: digits, no sign, no trailing text
std::optional<std::uint32_t> parse_count(std::string_view text) {
    if (text.empty()) return std::nullopt;

    std::string s(text);
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size() || s.front() == '-' || s.front() == '+') {
        return std::nullopt;
    }
    if (value == 0 || value > core::MAX_CONNECTIONS) {
        return std::nullopt;
    }
    return static_cast<std::uint32_t>(value);
}

// Value of "-k N", "-k=N", "--num-connections N" or "--num-connections=N"
std::optional<std::string> option_value(std::string_view arg, std::string_view name,
                                        int& i, int argc, char* argv[], bool& matched) {
    matched = false;
    if (arg == name) {
        matched = true;
        if (i + 1 < argc) {
            return std::string(argv[++i]);
        }
        return std::nullopt;
    }
    if (arg.starts_with(name) && arg.size() > name.size() && arg[name.size()] == '=') {
        matched = true;
        return std::string(arg.substr(name.size() + 1));
    }
    return std::nullopt;
}

} // namespace

//=============================================================================
// Argument parsing
//=============================================================================

std::expected<CliArgs, std::error_code> parse_args(int argc, char* argv[]) {
    CliArgs args;
    auto invalid = [](std::string_view what, std::string_view arg) {
        spdlog::error("{}: {}", what, arg);
        return std::unexpected(make_error_code(core::DownloadErrc::invalid_argument));
    };

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        bool matched = false;

        if (arg == "-h" || arg == "--help") {
            args.help = true;
            return args;
        }
        if (arg == "-v" || arg == "--version") {
            args.version = true;
            return args;
        }
        if (arg == "-V" || arg == "--verbose") {
            args.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            args.quiet = true;
            continue;
        }
        if (arg == "-i" || arg == "--info") {
            args.info = true;
            continue;
        }

        for (auto name : {std::string_view{"-k"}, std::string_view{"--num-connections"}}) {
            auto value = option_value(arg, name, i, argc, argv, matched);
            if (!matched) continue;
            auto count = value ? parse_count(*value) : std::nullopt;
            if (!count) {
                return invalid("Invalid connection count", value.value_or(std::string(arg)));
            }
            args.connections = count;
            break;
        }
        if (matched) continue;

        for (auto name : {std::string_view{"-o"}, std::string_view{"--output"}}) {
            auto value = option_value(arg, name, i, argc, argv, matched);
            if (!matched) continue;
            if (!value || value->empty()) {
                return invalid("Missing output file after", arg);
            }
            args.output_file = *value;
            break;
        }
        if (matched) continue;

        for (auto name : {std::string_view{"-c"}, std::string_view{"--config"}}) {
            auto value = option_value(arg, name, i, argc, argv, matched);
            if (!matched) continue;
            if (!value || value->empty()) {
                return invalid("Missing config file after", arg);
            }
            args.config_path = *value;
            break;
        }
        if (matched) continue;

        if (arg.starts_with("-") && arg.size() > 1) {
            return invalid("Unknown option", arg);
        }
        if (!args.url.empty()) {
            return invalid("Only one URL may be given, extra", arg);
        }
        args.url = std::string(arg);
    }

    return args;
}

std::expected<core::DownloadConfig, std::error_code> resolve_config(const CliArgs& args) {
    core::DownloadConfig config;
    std::optional<std::string> log_level;

    std::string path = args.config_path;
    bool explicit_path = !path.empty();
    if (!explicit_path) {
        path = core::Settings::default_path();
    }

    std::error_code exists_ec;
    if (!path.empty() && (explicit_path || std::filesystem::exists(path, exists_ec))) {
        auto settings = core::Settings::load(path);
        if (!settings) {
            spdlog::error("Cannot load settings from {}: {}", path, settings.error().message());
            return std::unexpected(settings.error());
        }
        settings->apply(config);
        log_level = settings->log_level;
        spdlog::debug("Loaded settings from {}", path);
    }

    if (args.connections) {
        config.connections = *args.connections;
    }

    // Command line flags win over the settings file
    if (args.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (args.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else if (log_level) {
        auto level = spdlog::level::from_str(*log_level);
        if (level == spdlog::level::off && *log_level != "off") {
            spdlog::error("Unknown log_level: {}", *log_level);
            return std::unexpected(make_error_code(core::DownloadErrc::config_error));
        }
        spdlog::set_level(level);
    }

    return config;
}

//=============================================================================
// Commands
//=============================================================================

CliResult download(const CliArgs& args, const core::DownloadConfig& config) {
    auto url = core::Url::parse(args.url);
    if (!url) {
        spdlog::error("Invalid URL: {}", args.url);
        return std::unexpected(url.error());
    }

    std::string output = args.output_file.empty() ? url->filename() : args.output_file;

    core::CurlTransport::global_init();

    std::error_code ec;
    std::uint64_t written = 0;
    {
        core::CurlTransport transport(config.connect_timeout);
        core::DownloadCoordinator coordinator(transport, config);

        ProgressBar bar(std::cout);
        if (!args.quiet) {
            coordinator.callback([&bar](const core::ProgressSample& sample) { bar.update(sample); });
        }

        ec = coordinator.run(*url, output);
        written = coordinator.total_written();
        if (ec) {
            bar.clear();
        } else {
            bar.finish();
        }
    }

    core::CurlTransport::global_cleanup();

    if (ec) {
        spdlog::error("Download of {} failed: {}", args.url, ec.message());
        return std::unexpected(ec);
    }

    if (!args.quiet) {
        std::cout << "Saved " << output << " (" << ProgressBar::format_bytes(written) << ")" << std::endl;
    }
    return 0;
}

CliResult info(const CliArgs& args, const core::DownloadConfig& config) {
    auto url = core::Url::parse(args.url);
    if (!url) {
        spdlog::error("Invalid URL: {}", args.url);
        return std::unexpected(url.error());
    }

    core::CurlTransport::global_init();
    std::expected<std::uint64_t, std::error_code> length;
    {
        core::CurlTransport transport(config.connect_timeout);
        length = transport.content_length(*url);
    }
    core::CurlTransport::global_cleanup();

    if (!length) {
        spdlog::error("{}: {}", args.url, length.error().message());
        return std::unexpected(length.error());
    }

    std::string output = args.output_file.empty() ? url->filename() : args.output_file;
    std::cout << "URL: " << url->str() << "\n";
    std::cout << "Output: " << output << "\n";
    std::cout << "Content-Length: " << *length << " (" << ProgressBar::format_bytes(*length) << ")\n";
    std::cout << "Connections: " << config.connections << "\n";

    auto stops = core::partition_stops(*length, config.connections);
    for (std::size_t i = 0; i + 1 < stops.size(); ++i) {
        std::cout << "  segment " << i << ": [" << stops[i] << ", " << stops[i + 1] << ")\n";
    }
    std::cout << std::flush;
    return 0;
}

void print_help(std::string_view program_name) {
    std::cout << "mdown " << mdown::version.to_string() << " - parallel segment downloader\n";
    std::cout << "\n";
    std::cout << "USAGE:\n";
    std::cout << "  " << program_name << " [OPTIONS] <URL>\n";
    std::cout << "\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  -k, --num-connections <N>  Number of connections (default: "
              << core::DEFAULT_NUM_CONNECTIONS << ")\n";
    std::cout << "  -o, --output <FILE>        Save to FILE instead of the URL basename\n";
    std::cout << "  -c, --config <FILE>        Read settings from a JSON file\n";
    std::cout << "  -i, --info                 Show length and segments without downloading\n";
    std::cout << "  -V, --verbose              Debug logging\n";
    std::cout << "  -q, --quiet                No progress line, warnings and errors only\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -v, --version              Show version information\n";
    std::cout << "\n";
    std::cout << "EXAMPLES:\n";
    std::cout << "  " << program_name << " https://example.com/file.iso\n";
    std::cout << "  " << program_name << " -k=10 https://example.com/file.iso\n";
}

void print_version() {
    std::cout << "mdown " << mdown::version.to_string() << std::endl;
    std::cout << "Built " << mdown::BUILD_DATE << " " << mdown::BUILD_TIME << std::endl;
    std::cout << "Built with C++23, libcurl " << core::CurlTransport::curl_version() << std::endl;
}

} // namespace mdown::cli
