// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/curl_transport.hpp>
#include <curl/curl.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <iterator>
#include <cctype>
#include <map>
#include <string_view>
#include <vector>

namespace mdown::core {

namespace {

// RAII curl handle cleanup
struct CurlHandle {
    CURL* ptr = nullptr;

    CurlHandle() = default;
    explicit CurlHandle(CURL* c) : ptr(c) {}
    ~CurlHandle() { if (ptr) curl_easy_cleanup(ptr); }

    CurlHandle(const CurlHandle&) = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;
    CurlHandle(CurlHandle&& other) noexcept : ptr(other.ptr) { other.ptr = nullptr; }
    CurlHandle& operator=(CurlHandle&& other) noexcept {
        if (this != &other) {
            if (ptr) curl_easy_cleanup(ptr);
            ptr = other.ptr;
            other.ptr = nullptr;
        }
        return *this;
    }
};

// Error statuses shared by HEAD and GET
std::error_code error_status(long http_code) noexcept {
    if (http_code == 404 || http_code == 410) return make_error_code(DownloadErrc::not_found);
    if (http_code == 416) return make_error_code(DownloadErrc::invalid_range);
    if (http_code == 401 || http_code == 403) return make_error_code(DownloadErrc::permission_denied);
    if (http_code >= 500) return make_error_code(DownloadErrc::server_error);
    if (http_code >= 400) return make_error_code(DownloadErrc::network_error);
    return {};
}

bool is_digits(std::string_view s) noexcept {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<std::uint64_t> to_u64(std::string_view s) noexcept {
    if (!is_digits(s)) return std::nullopt;
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) return std::nullopt;
    return value;
}

} // namespace

namespace detail {

std::error_code check_head_status(long http_code) noexcept {
    if (auto ec = error_status(http_code)) return ec;
    if (http_code < 200 || http_code > 299) {
        // Redirects are not followed; their body is not the resource
        return make_error_code(DownloadErrc::unexpected_status);
    }
    return {};
}

std::error_code check_range_response(long http_code,
                                     ByteRange range,
                                     std::string_view content_range) noexcept {
    if (auto ec = error_status(http_code)) return ec;

    if (http_code == 200) {
        // Range header ignored: the body starts at byte 0
        return range.start == 0 ? std::error_code{} : make_error_code(DownloadErrc::invalid_range);
    }
    if (http_code != 206) {
        return make_error_code(DownloadErrc::unexpected_status);
    }

    auto first = content_range_start(content_range);
    if (!first || *first != range.start) {
        return make_error_code(DownloadErrc::invalid_range);
    }
    return {};
}

std::optional<std::uint64_t> content_range_start(std::string_view value) noexcept {
    constexpr std::string_view unit = "bytes ";
    if (!value.starts_with(unit)) return std::nullopt;
    value.remove_prefix(unit.size());

    auto dash = value.find('-');
    if (dash == std::string_view::npos) return std::nullopt;
    return to_u64(value.substr(0, dash));
}

std::expected<std::uint64_t, std::error_code> parse_content_length(std::string_view value) noexcept {
    auto length = to_u64(value);
    if (!length) {
        return std::unexpected(make_error_code(DownloadErrc::missing_content_length));
    }
    return *length;
}

std::error_code curl_result_to_error(int result) noexcept {
    switch (static_cast<CURLcode>(result)) {
        case CURLE_OK:                  return {};
        case CURLE_OPERATION_TIMEDOUT:  return make_error_code(DownloadErrc::timeout);
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
                                        return make_error_code(DownloadErrc::invalid_url);
        case CURLE_PARTIAL_FILE:
        case CURLE_GOT_NOTHING:
        case CURLE_RECV_ERROR:
        case CURLE_SEND_ERROR:
#if LIBCURL_VERSION_NUM >= 0x073100
        case CURLE_HTTP2_STREAM:
#endif
                                        return make_error_code(DownloadErrc::connection_lost);
        default:                        return make_error_code(DownloadErrc::network_error);
    }
}

std::error_code fetch_outcome(bool stopped_by_handler,
                              std::error_code recorded,
                              int curl_result,
                              long http_code,
                              ByteRange range,
                              std::string_view content_range) noexcept {
    // The chunk handler asked to stop: a clean end, whatever curl reports
    if (stopped_by_handler) return {};
    if (recorded) return recorded;
    if (curl_result != CURLE_OK) return curl_result_to_error(curl_result);
    return check_range_response(http_code, range, content_range);
}

} // namespace detail

namespace {

// Header callback; keeps lowercase names of the last response's headers
std::size_t header_callback(char* buffer, std::size_t size, std::size_t nitems, void* userdata) {
    std::size_t total = size * nitems;
    auto* headers = static_cast<std::map<std::string, std::string>*>(userdata);
    if (!headers) return total;

    std::string_view header(buffer, total);

    // A new status line starts a new header block
    if (header.starts_with("HTTP/")) {
        headers->clear();
        return total;
    }

    auto colon = header.find(':');
    if (colon == std::string_view::npos) return total;

    auto name = header.substr(0, colon);
    auto value = header.substr(colon + 1);

    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == '\r' || value.back() == '\n' || value.back() == ' ')) {
        value.remove_suffix(1);
    }

    std::string lower_name;
    lower_name.reserve(name.size());
    for (char c : name) {
        lower_name += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    (*headers)[lower_name] = std::string(value);
    return total;
}

std::size_t discard_callback(char*, std::size_t size, std::size_t nitems, void*) {
    return size * nitems;
}

void apply_common_options(CURL* curl, const std::string& url, std::chrono::seconds connect_timeout) {
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 0L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_NODELAY, 1L);
}

} // namespace

// One ranged GET in flight
struct CurlTransport::Fetch {
    CurlHandle easy;
    ByteRange range;
    ChunkHandler on_chunk;
    EndHandler on_end;
    std::string range_header;
    std::map<std::string, std::string> headers;
    bool status_checked{false};
    bool stopped_by_handler{false};
    std::error_code error;
};

namespace {

std::size_t write_callback(char* ptr, std::size_t size, std::size_t nmemb, void* userdata) noexcept {
    auto* fetch = static_cast<CurlTransport::Fetch*>(userdata);
    std::size_t bytes = size * nmemb;

    if (!fetch->status_checked) {
        fetch->status_checked = true;

        long http_code = 0;
        curl_easy_getinfo(fetch->easy.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        auto it = fetch->headers.find("content-range");
        std::string_view content_range = it == fetch->headers.end() ? std::string_view{} : it->second;
        if (auto ec = detail::check_range_response(http_code, fetch->range, content_range)) {
            // Error page, redirect or wrong range: not resource bytes
            fetch->error = ec;
            return 0;
        }
    }

    try {
        bool keep_going = fetch->on_chunk(std::span<const std::byte>(
            reinterpret_cast<const std::byte*>(ptr), bytes));
        if (!keep_going) {
            fetch->stopped_by_handler = true;
            return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
        }
    } catch (const std::exception& e) {
        spdlog::error("Chunk handler threw: {}", e.what());
        fetch->error = make_error_code(DownloadErrc::network_error);
        return 0;
    }
    return bytes;
}

} // namespace

//=============================================================================
// CurlTransport
//=============================================================================

CurlTransport::CurlTransport(std::chrono::seconds connect_timeout)
    : multi_(curl_multi_init())
    , connect_timeout_(connect_timeout) {}

CurlTransport::~CurlTransport() {
    auto* multi = static_cast<CURLM*>(multi_);
    for (auto& [handle, fetch] : fetches_) {
        if (multi) {
            curl_multi_remove_handle(multi, static_cast<CURL*>(handle));
        }
    }
    fetches_.clear();
    if (multi) {
        curl_multi_cleanup(multi);
    }
}

std::expected<std::uint64_t, std::error_code>
CurlTransport::content_length(const Url& url) {
    CurlHandle curl(curl_easy_init());
    if (!curl.ptr) {
        return std::unexpected(make_error_code(DownloadErrc::network_error));
    }

    std::map<std::string, std::string> headers;

    apply_common_options(curl.ptr, url.str(), connect_timeout_);
    curl_easy_setopt(curl.ptr, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl.ptr, CURLOPT_HEADERDATA, &headers);
    curl_easy_setopt(curl.ptr, CURLOPT_WRITEFUNCTION, discard_callback);

    CURLcode result = curl_easy_perform(curl.ptr);
    if (result != CURLE_OK) {
        spdlog::error("HEAD {} failed: {}", url.str(), curl_easy_strerror(result));
        return std::unexpected(detail::curl_result_to_error(result));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.ptr, CURLINFO_RESPONSE_CODE, &http_code);
    if (auto ec = detail::check_head_status(http_code)) {
        spdlog::error("HEAD {} returned HTTP {}", url.str(), http_code);
        return std::unexpected(ec);
    }

    // CURLINFO_CONTENT_LENGTH_DOWNLOAD_T is not reliable for HEAD; read the header
    auto cl_it = headers.find("content-length");
    if (cl_it == headers.end()) {
        return std::unexpected(make_error_code(DownloadErrc::missing_content_length));
    }
    return detail::parse_content_length(cl_it->second);
}

void CurlTransport::fetch(const Url& url, ByteRange range,
                          ChunkHandler on_chunk, EndHandler on_end) {
    auto fetch = std::make_unique<Fetch>();
    fetch->range = range;
    fetch->on_chunk = std::move(on_chunk);
    fetch->on_end = std::move(on_end);
    fetch->easy = CurlHandle(curl_easy_init());

    auto* multi = static_cast<CURLM*>(multi_);
    if (!fetch->easy.ptr || !multi) {
        // Report asynchronously, like any other stream end
        post([cb = std::move(fetch->on_end)] { cb(make_error_code(DownloadErrc::network_error)); });
        return;
    }

    CURL* curl = fetch->easy.ptr;
    fetch->range_header = range.to_http();

    apply_common_options(curl, url.str(), connect_timeout_);
    curl_easy_setopt(curl, CURLOPT_RANGE, fetch->range_header.c_str());
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &fetch->headers);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, fetch.get());
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(RECEIVE_BUFFER_SIZE));

    CURLMcode mc = curl_multi_add_handle(multi, curl);
    if (mc != CURLM_OK) {
        spdlog::error("curl_multi_add_handle failed: {}", curl_multi_strerror(mc));
        post([cb = std::move(fetch->on_end)] { cb(make_error_code(DownloadErrc::network_error)); });
        return;
    }

    spdlog::trace("GET {} bytes={}", url.str(), fetch->range_header);
    fetches_.emplace(curl, std::move(fetch));
}

void CurlTransport::post(std::function<void()> task) {
    posted_.push_back(std::move(task));
}

void CurlTransport::set_timer(std::chrono::milliseconds interval, std::function<void()> on_timer) {
    timer_ = Timer{interval, std::chrono::steady_clock::now() + interval, std::move(on_timer)};
}

void CurlTransport::cancel_timer() noexcept {
    timer_.reset();
}

std::error_code CurlTransport::run() {
    auto* multi = static_cast<CURLM*>(multi_);
    if (!multi) {
        return make_error_code(DownloadErrc::network_error);
    }

    stopped_ = false;
    while (!stopped_) {
        run_posted();
        if (stopped_) break;

        int running = 0;
        CURLMcode mc = curl_multi_perform(multi, &running);
        if (mc != CURLM_OK) {
            spdlog::error("curl_multi_perform failed: {}", curl_multi_strerror(mc));
            return make_error_code(DownloadErrc::network_error);
        }

        dispatch_completed();
        if (stopped_) break;

        fire_timer();
        if (stopped_) break;

        if (!posted_.empty()) continue;

        // Nothing in flight and nothing queued: no event can ever arrive
        if (fetches_.empty()) {
            return make_error_code(DownloadErrc::incomplete);
        }

        mc = curl_multi_poll(multi, nullptr, 0, static_cast<int>(poll_wait().count()), nullptr);
        if (mc != CURLM_OK) {
            spdlog::error("curl_multi_poll failed: {}", curl_multi_strerror(mc));
            return make_error_code(DownloadErrc::network_error);
        }
    }
    return {};
}

void CurlTransport::run_posted() {
    // Tasks posted while draining wait for the next turn
    auto batch = std::move(posted_);
    posted_.clear();
    while (!batch.empty()) {
        auto task = std::move(batch.front());
        batch.pop_front();
        task();
        if (stopped_) {
            // stop() ends dispatch but keeps queued work for a later run()
            posted_.insert(posted_.begin(),
                           std::make_move_iterator(batch.begin()),
                           std::make_move_iterator(batch.end()));
            return;
        }
    }
}

void CurlTransport::dispatch_completed() {
    auto* multi = static_cast<CURLM*>(multi_);

    std::vector<std::pair<std::unique_ptr<Fetch>, CURLcode>> done;
    int queued = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi, &queued)) {
        if (msg->msg != CURLMSG_DONE) continue;

        auto it = fetches_.find(msg->easy_handle);
        if (it == fetches_.end()) continue;

        curl_multi_remove_handle(multi, msg->easy_handle);
        done.emplace_back(std::move(it->second), msg->data.result);
        fetches_.erase(it);
    }

    // Handlers may start new fetches, so run them after the read loop
    for (auto& [fetch, result] : done) {
        long http_code = 0;
        curl_easy_getinfo(fetch->easy.ptr, CURLINFO_RESPONSE_CODE, &http_code);
        auto it = fetch->headers.find("content-range");
        std::string_view content_range = it == fetch->headers.end() ? std::string_view{} : it->second;

        if (result != CURLE_OK && !fetch->stopped_by_handler && !fetch->error) {
            spdlog::debug("Fetch bytes={} ended: {}", fetch->range_header, curl_easy_strerror(result));
        }
        auto ec = detail::fetch_outcome(fetch->stopped_by_handler, fetch->error, result,
                                        http_code, fetch->range, content_range);

        auto on_end = std::move(fetch->on_end);
        fetch.reset();
        on_end(ec);
    }
}

void CurlTransport::fire_timer() {
    if (!timer_) return;

    auto now = std::chrono::steady_clock::now();
    if (now < timer_->due) return;

    timer_->due = now + timer_->interval;
    auto cb = timer_->callback;
    cb();
}

std::chrono::milliseconds CurlTransport::poll_wait() const noexcept {
    auto wait = MAX_POLL_WAIT;
    if (timer_) {
        auto until = std::chrono::duration_cast<std::chrono::milliseconds>(
            timer_->due - std::chrono::steady_clock::now());
        wait = std::clamp(until, std::chrono::milliseconds{0}, wait);
    }
    return wait;
}

//=============================================================================
// Global CURL initialization
//=============================================================================

void CurlTransport::global_init() noexcept {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() noexcept {
    curl_global_cleanup();
}

std::string CurlTransport::curl_version() {
    const curl_version_info_data* info = curl_version_info(CURLVERSION_NOW);
    return info && info->version ? info->version : "unknown";
}

} // namespace mdown::core
