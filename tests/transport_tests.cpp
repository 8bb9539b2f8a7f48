// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mdown/core/curl_transport.hpp>
#include <curl/curl.h>

using namespace mdown::core;
using namespace mdown::core::detail;

TEST_CASE("check_range_response - accepted responses", "[transport]") {
    SECTION("206 with a matching Content-Range") {
        CHECK_FALSE(check_range_response(206, {500, 1'000}, "bytes 500-999/1000"));
        CHECK_FALSE(check_range_response(206, {0, 10}, "bytes 0-9/*"));
    }

    SECTION("200 is the whole resource, usable only from byte 0") {
        CHECK_FALSE(check_range_response(200, {0, 250}, ""));
    }
}

TEST_CASE("check_range_response - rejected responses", "[transport]") {
    SECTION("200 to a range that does not start at 0") {
        CHECK(check_range_response(200, {250, 500}, "") == DownloadErrc::invalid_range);
    }

    SECTION("206 for the wrong offset") {
        CHECK(check_range_response(206, {500, 1'000}, "bytes 0-499/1000") == DownloadErrc::invalid_range);
    }

    SECTION("206 without Content-Range") {
        CHECK(check_range_response(206, {500, 1'000}, "") == DownloadErrc::invalid_range);
    }

    SECTION("Redirects and other non-range statuses") {
        auto status = GENERATE(as<long>{}, 204, 301, 302, 304, 307, 308);
        CHECK(check_range_response(status, {0, 100}, "") == DownloadErrc::unexpected_status);
        CHECK(check_range_response(status, {100, 200}, "") == DownloadErrc::unexpected_status);
    }

    SECTION("Error statuses") {
        CHECK(check_range_response(404, {0, 100}, "") == DownloadErrc::not_found);
        CHECK(check_range_response(410, {0, 100}, "") == DownloadErrc::not_found);
        CHECK(check_range_response(416, {0, 100}, "") == DownloadErrc::invalid_range);
        CHECK(check_range_response(403, {0, 100}, "") == DownloadErrc::permission_denied);
        CHECK(check_range_response(500, {0, 100}, "") == DownloadErrc::server_error);
        CHECK(check_range_response(503, {0, 100}, "") == DownloadErrc::server_error);
        CHECK(check_range_response(429, {0, 100}, "") == DownloadErrc::network_error);
    }
}

TEST_CASE("check_head_status", "[transport]") {
    CHECK_FALSE(check_head_status(200));
    CHECK_FALSE(check_head_status(204));
    CHECK(check_head_status(301) == DownloadErrc::unexpected_status);
    CHECK(check_head_status(302) == DownloadErrc::unexpected_status);
    CHECK(check_head_status(404) == DownloadErrc::not_found);
    CHECK(check_head_status(502) == DownloadErrc::server_error);
}

TEST_CASE("content_range_start", "[transport]") {
    CHECK(content_range_start("bytes 750-999/1000") == std::optional<std::uint64_t>{750});
    CHECK(content_range_start("bytes 0-0/*") == std::optional<std::uint64_t>{0});
    CHECK_FALSE(content_range_start("").has_value());
    CHECK_FALSE(content_range_start("bytes */1000").has_value());
    CHECK_FALSE(content_range_start("items 0-9/10").has_value());
    CHECK_FALSE(content_range_start("bytes -5-9/10").has_value());
}

TEST_CASE("parse_content_length", "[transport]") {
    CHECK(parse_content_length("0") == 0u);
    CHECK(parse_content_length("162") == 162u);
    CHECK(parse_content_length("5000000000") == 5'000'000'000ULL);

    auto bad = GENERATE(as<std::string>{}, "", "-1", "12abc", " 12", "99999999999999999999999");
    auto length = parse_content_length(bad);
    REQUIRE_FALSE(length.has_value());
    CHECK(length.error() == DownloadErrc::missing_content_length);
}

TEST_CASE("curl_result_to_error", "[transport]") {
    CHECK_FALSE(curl_result_to_error(CURLE_OK));
    CHECK(curl_result_to_error(CURLE_PARTIAL_FILE) == DownloadErrc::connection_lost);
    CHECK(curl_result_to_error(CURLE_RECV_ERROR) == DownloadErrc::connection_lost);
    CHECK(curl_result_to_error(CURLE_GOT_NOTHING) == DownloadErrc::connection_lost);
    CHECK(curl_result_to_error(CURLE_OPERATION_TIMEDOUT) == DownloadErrc::timeout);
    CHECK(curl_result_to_error(CURLE_URL_MALFORMAT) == DownloadErrc::invalid_url);
    CHECK(curl_result_to_error(CURLE_COULDNT_CONNECT) == DownloadErrc::network_error);
}

TEST_CASE("fetch_outcome", "[transport]") {
    ByteRange range{250, 500};
    auto stop_error = make_error_code(DownloadErrc::invalid_range);

    SECTION("Stopped by the chunk handler is a clean end") {
        CHECK_FALSE(fetch_outcome(true, {}, CURLE_WRITE_ERROR, 206, range, "bytes 250-499/1000"));
    }

    SECTION("Error recorded by the write callback wins over curl's code") {
        CHECK(fetch_outcome(false, stop_error, CURLE_WRITE_ERROR, 200, range, "") == stop_error);
    }

    SECTION("Transport failure") {
        CHECK(fetch_outcome(false, {}, CURLE_PARTIAL_FILE, 206, range, "bytes 250-499/1000")
              == DownloadErrc::connection_lost);
    }

    SECTION("Completed transfer is judged by its status") {
        CHECK_FALSE(fetch_outcome(false, {}, CURLE_OK, 206, range, "bytes 250-499/1000"));
        CHECK(fetch_outcome(false, {}, CURLE_OK, 301, range, "") == DownloadErrc::unexpected_status);
        CHECK(fetch_outcome(false, {}, CURLE_OK, 404, range, "") == DownloadErrc::not_found);
    }
}
