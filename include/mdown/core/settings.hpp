// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/config.hpp>
#include <mdown/core/error.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace mdown::core {

// Values read from a JSON settings file. Unset fields leave the
// corresponding DownloadConfig value alone.
struct Settings {
    std::optional<std::uint32_t> connections;
    std::optional<std::uint64_t> split_threshold;
    std::optional<std::uint32_t> stats_interval_sec;
    std::optional<std::uint32_t> max_retries;
    std::optional<std::uint32_t> connect_timeout_sec;
    std::optional<std::string> staging_suffix;
    std::optional<std::string> log_level;

    // Parse settings from JSON text
    [[nodiscard]] static std::expected<Settings, std::error_code>
    parse(std::string_view json) noexcept;

    // Load settings from a file
    [[nodiscard]] static std::expected<Settings, std::error_code>
    load(const std::string& path) noexcept;

    // $XDG_CONFIG_HOME/mdown/config.json, else ~/.config/mdown/config.json.
    // Empty if neither variable is set.
    [[nodiscard]] static std::string default_path();

    void apply(DownloadConfig& config) const;
};

} // namespace mdown::core
