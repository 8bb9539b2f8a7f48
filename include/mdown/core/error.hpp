// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace mdown::core {

enum class DownloadErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    invalid_url,
    invalid_range,
    missing_content_length,
    connection_lost,
    retries_exhausted,
    incomplete,
    invalid_argument,
    config_error,
    unexpected_status,
};

namespace detail {

struct DownloadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "mdown::download";
    }

    [[nodiscard]] std::string message(int ev) const override {
        switch (static_cast<DownloadErrc>(ev)) {
            case DownloadErrc::success:                return "Success";
            case DownloadErrc::network_error:          return "Network error";
            case DownloadErrc::timeout:                return "Operation timed out";
            case DownloadErrc::not_found:              return "Resource not found (404)";
            case DownloadErrc::server_error:           return "Server error";
            case DownloadErrc::permission_denied:      return "Permission denied";
            case DownloadErrc::invalid_url:            return "Invalid URL";
            case DownloadErrc::invalid_range:          return "Server rejected the byte range";
            case DownloadErrc::missing_content_length: return "Cannot find a content-length header";
            case DownloadErrc::connection_lost:        return "Connection closed before the range was delivered";
            case DownloadErrc::retries_exhausted:      return "Retries exhausted";
            case DownloadErrc::incomplete:             return "Download incomplete";
            case DownloadErrc::invalid_argument:       return "Invalid argument";
            case DownloadErrc::config_error:           return "Invalid configuration";
            case DownloadErrc::unexpected_status:      return "Unexpected HTTP status";
            default:                                   return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DownloadErrcCategory& download_errc_category() noexcept {
    static detail::DownloadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DownloadErrc e) noexcept {
    return {static_cast<int>(e), download_errc_category()};
}

} // namespace mdown::core

namespace std {

template<>
struct is_error_code_enum<mdown::core::DownloadErrc> : true_type {};

} // namespace std
