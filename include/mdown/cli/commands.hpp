// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/config.hpp>
#include <mdown/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace mdown::cli {

// CLI result
using CliResult = std::expected<int, std::error_code>;

// Command line arguments
struct CliArgs {
    std::string url;
    std::string output_file;
    std::string config_path;
    std::optional<std::uint32_t> connections;
    bool info{false};
    bool verbose{false};
    bool quiet{false};
    bool version{false};
    bool help{false};
};

// Parse command line arguments
[[nodiscard]] std::expected<CliArgs, std::error_code> parse_args(int argc, char* argv[]);

// Build the job configuration: defaults, then the settings file, then
// command line overrides. Also applies the log level.
[[nodiscard]] std::expected<core::DownloadConfig, std::error_code>
resolve_config(const CliArgs& args);

// Download a single URL
[[nodiscard]] CliResult download(const CliArgs& args, const core::DownloadConfig& config);

// Show length and initial partition without downloading
[[nodiscard]] CliResult info(const CliArgs& args, const core::DownloadConfig& config);

// Show help message
void print_help(std::string_view program_name);

// Show version information
void print_version();

} // namespace mdown::cli
