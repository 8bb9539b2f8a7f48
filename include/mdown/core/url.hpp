// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace mdown::core {

class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] std::string_view scheme() const noexcept { return scheme_; }
    [[nodiscard]] std::string_view host() const noexcept { return host_; }
    [[nodiscard]] std::string_view port() const noexcept { return port_; }
    [[nodiscard]] std::string_view path() const noexcept { return path_; }
    [[nodiscard]] std::string_view query() const noexcept { return query_; }

    // The URL as given, for handing to the transport
    [[nodiscard]] const std::string& str() const noexcept { return str_; }
    [[nodiscard]] bool is_secure() const noexcept { return scheme_ == "https"; }

    // Basename of the path component, used as the output file name
    [[nodiscard]] std::string filename() const;

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace mdown::core
