// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/transport.hpp>
#include <mdown/core/config.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace mdown::core {

namespace detail {

// Status of a HEAD response. Only 2xx is acceptable.
[[nodiscard]] std::error_code check_head_status(long http_code) noexcept;

// Status of a ranged GET for `range`. 206 is required, with a Content-Range
// that starts at range.start. A 200 (the whole resource) is accepted only
// when the range starts at 0.
[[nodiscard]] std::error_code check_range_response(long http_code,
                                                   ByteRange range,
                                                   std::string_view content_range) noexcept;

// First byte of a "bytes first-last/total" Content-Range value
[[nodiscard]] std::optional<std::uint64_t> content_range_start(std::string_view value) noexcept;

// Content-Length header value; digits only
[[nodiscard]] std::expected<std::uint64_t, std::error_code>
parse_content_length(std::string_view value) noexcept;

// libcurl result code (CURLcode) to a download error
[[nodiscard]] std::error_code curl_result_to_error(int result) noexcept;

// Terminal error reported for a finished ranged GET
[[nodiscard]] std::error_code fetch_outcome(bool stopped_by_handler,
                                            std::error_code recorded,
                                            int curl_result,
                                            long http_code,
                                            ByteRange range,
                                            std::string_view content_range) noexcept;

} // namespace detail

// Transport over the libcurl multi interface. One easy handle per
// in-flight fetch, all driven from the thread that calls run().
class CurlTransport final : public Transport {
public:
    explicit CurlTransport(std::chrono::seconds connect_timeout = std::chrono::seconds{CONNECTION_TIMEOUT_SEC});
    ~CurlTransport() override;

    // Non-copyable, non-movable (easy handles point back at us)
    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    [[nodiscard]] std::expected<std::uint64_t, std::error_code>
    content_length(const Url& url) override;

    void fetch(const Url& url, ByteRange range,
               ChunkHandler on_chunk, EndHandler on_end) override;

    void post(std::function<void()> task) override;

    void set_timer(std::chrono::milliseconds interval, std::function<void()> on_timer) override;
    void cancel_timer() noexcept override;

    [[nodiscard]] std::error_code run() override;
    void stop() noexcept override { stopped_ = true; }


    // Global initialization (call once at startup)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

    // libcurl version string, e.g. "8.5.0"
    [[nodiscard]] static std::string curl_version();

    struct Fetch;

private:
    struct Timer {
        std::chrono::milliseconds interval;
        std::chrono::steady_clock::time_point due;
        std::function<void()> callback;
    };

    void run_posted();
    void dispatch_completed();
    void fire_timer();
    [[nodiscard]] std::chrono::milliseconds poll_wait() const noexcept;

    void* multi_{nullptr};  // CURLM*
    std::chrono::seconds connect_timeout_;
    std::map<void*, std::unique_ptr<Fetch>> fetches_;  // keyed by CURL*
    std::deque<std::function<void()>> posted_;
    std::optional<Timer> timer_;
    bool stopped_{false};
};

} // namespace mdown::core
