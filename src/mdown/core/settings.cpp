// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/settings.hpp>
#include <mdown/disk/error.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace mdown::core {

namespace {

template<typename T>
std::optional<T> read_unsigned(const nlohmann::json& j, const char* key, T min_value,
                               T max_value = std::numeric_limits<T>::max()) {
    if (!j.contains(key)) {
        return std::nullopt;
    }

    const auto& value = j[key];
    // The parser stores every non-negative integer literal as unsigned
    if (!value.is_number_unsigned()) {
        throw std::invalid_argument(std::string(key) + " must be a non-negative integer");
    }

    auto raw = value.get<std::uint64_t>();
    if (raw < min_value || raw > max_value) {
        throw std::out_of_range(std::string(key) + " is out of range");
    }
    return static_cast<T>(raw);
}

std::optional<std::string> read_string(const nlohmann::json& j, const char* key) {
    if (!j.contains(key)) {
        return std::nullopt;
    }
    if (!j[key].is_string()) {
        throw std::invalid_argument(std::string(key) + " must be a string");
    }
    return j[key].get<std::string>();
}

} // namespace

std::expected<Settings, std::error_code> Settings::parse(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            spdlog::error("Settings: top level must be an object");
            return std::unexpected(make_error_code(DownloadErrc::config_error));
        }

        Settings s;
        s.connections = read_unsigned<std::uint32_t>(j, "connections", 1, MAX_CONNECTIONS);
        s.split_threshold = read_unsigned<std::uint64_t>(j, "split_threshold", 1);
        s.stats_interval_sec = read_unsigned<std::uint32_t>(j, "stats_interval_sec", 1);
        s.max_retries = read_unsigned<std::uint32_t>(j, "max_retries", 0);
        s.connect_timeout_sec = read_unsigned<std::uint32_t>(j, "connect_timeout_sec", 1);
        s.staging_suffix = read_string(j, "staging_suffix");
        s.log_level = read_string(j, "log_level");

        if (s.staging_suffix && s.staging_suffix->empty()) {
            throw std::invalid_argument("staging_suffix must not be empty");
        }
        return s;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Settings: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    } catch (const std::exception& e) {
        spdlog::error("Settings: {}", e.what());
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }
}

std::expected<Settings, std::error_code> Settings::load(const std::string& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        return parse(contents.str());
    } catch (const std::exception& e) {
        spdlog::error("Settings: cannot read {}: {}", path, e.what());
        return std::unexpected(make_error_code(DownloadErrc::config_error));
    }
}

std::string Settings::default_path() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/mdown/config.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/mdown/config.json";
    }
    return {};
}

void Settings::apply(DownloadConfig& config) const {
    if (connections) config.connections = *connections;
    if (split_threshold) config.split_threshold = *split_threshold;
    if (stats_interval_sec) config.stats_interval = std::chrono::seconds{*stats_interval_sec};
    if (max_retries) config.max_retries = *max_retries;
    if (connect_timeout_sec) config.connect_timeout = std::chrono::seconds{*connect_timeout_sec};
    if (staging_suffix) config.staging_suffix = *staging_suffix;
}

} // namespace mdown::core
