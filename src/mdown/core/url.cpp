// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/url.hpp>
#include <algorithm>
#include <cctype>

namespace mdown::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3;

        auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
        auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
        auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());
        auto host_end = std::min({path_start, query_start, fragment_start});

        // Skip userinfo (user:pass@host)
        std::size_t authority_start = rest_start;
        auto at_pos = url_str.find('@', rest_start);
        if (at_pos != std::string_view::npos && at_pos < host_end) {
            authority_start = at_pos + 1;
        }

        auto authority = url_str.substr(authority_start, host_end - authority_start);
        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal [::1]:port
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(DownloadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto rest = authority.substr(bracket_end + 1);
            if (!rest.empty() && rest.front() == ':') {
                url.port_ = std::string(rest.substr(1));
            }
        } else {
            auto colon = authority.rfind(':');
            if (colon != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon));
                url.port_ = std::string(authority.substr(colon + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }
        if (!std::all_of(url.port_.begin(), url.port_.end(),
                         [](unsigned char c) { return std::isdigit(c) != 0; })) {
            return std::unexpected(make_error_code(DownloadErrc::invalid_url));
        }

        if (path_start < url_str.length() && path_start < query_start && path_start < fragment_start) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        // Fragments are never sent to the server
        url.str_ = std::string(url_str.substr(0, fragment_start));
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::string Url::filename() const {
    auto last_slash = path_.rfind('/');
    auto name = last_slash == std::string::npos ? path_ : path_.substr(last_slash + 1);
    // Directory URLs (path ends with /)
    if (name.empty() || name == "." || name == "..") {
        return "index.html";
    }
    return name;
}

} // namespace mdown::core
