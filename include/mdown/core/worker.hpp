// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/config.hpp>
#include <mdown/core/segment_store.hpp>
#include <mdown/core/transport.hpp>
#include <mdown/core/url.hpp>
#include <cstddef>
#include <cstdint>
#include <span>

namespace mdown::core {

// Drives fetches for one segment slot. When the slot's range is fully
// written it asks the store whether to take over part of the busiest
// segment or to terminate. A stream that ends early is retried on the
// same unclaimed range.
class Worker {
public:
    Worker(std::size_t index,
           Transport& transport,
           const Url& url,
           SegmentStore& store,
           const DownloadConfig& config,
           std::uint64_t& total_written) noexcept;

    // Non-copyable, non-movable (pending callbacks capture this)
    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    // Fetch [cursor, end) of the segment
    void start();

    [[nodiscard]] std::size_t index() const noexcept { return index_; }
    [[nodiscard]] std::uint32_t failures() const noexcept { return failures_; }
    [[nodiscard]] std::uint32_t fetches() const noexcept { return fetches_; }

private:
    bool on_chunk(std::span<const std::byte> chunk);
    void on_end(std::error_code ec);

    // Errors that another attempt at the same range cannot fix
    [[nodiscard]] static bool is_permanent(std::error_code ec) noexcept;

    std::size_t index_;
    Transport& transport_;
    const Url& url_;
    SegmentStore& store_;
    const DownloadConfig& config_;
    std::uint64_t& total_written_;

    std::error_code write_error_;
    std::uint32_t failures_{0};
    std::uint32_t fetches_{0};
};

} // namespace mdown::core
