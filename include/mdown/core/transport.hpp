// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/byte_range.hpp>
#include <mdown/core/error.hpp>
#include <mdown/core/url.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <functional>
#include <span>

namespace mdown::core {

// Receives one body chunk; return false to end the stream early
using ChunkHandler = std::function<bool(std::span<const std::byte>)>;

// Stream ended. An empty error_code means the server finished (or the
// chunk handler asked to stop); anything else is a transport failure.
using EndHandler = std::function<void(std::error_code)>;

// Single-threaded event source. Every callback it makes (chunk, end,
// posted task, timer) runs to completion before the next one starts.
class Transport {
public:
    virtual ~Transport() = default;

    // HEAD-equivalent; fails with missing_content_length if the server
    // does not report one
    [[nodiscard]] virtual std::expected<std::uint64_t, std::error_code>
    content_length(const Url& url) = 0;

    // Ranged GET for [range.start, range.end)
    virtual void fetch(const Url& url, ByteRange range,
                       ChunkHandler on_chunk, EndHandler on_end) = 0;

    // Run task on a later turn of the dispatch loop
    virtual void post(std::function<void()> task) = 0;

    // Periodic timer, first firing one interval after it is set
    virtual void set_timer(std::chrono::milliseconds interval, std::function<void()> on_timer) = 0;
    virtual void cancel_timer() noexcept = 0;

    // Dispatch events until stop() is called
    [[nodiscard]] virtual std::error_code run() = 0;
    virtual void stop() noexcept = 0;
};

} // namespace mdown::core
