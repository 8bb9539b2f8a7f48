// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/byte_range.hpp>
#include <mdown/core/error.hpp>
#include <mdown/disk/file_writer.hpp>
#include <cstdint>
#include <cstddef>
#include <expected>
#include <span>
#include <string_view>

namespace mdown::core {

enum class SegmentStatus : std::uint8_t {
    active,  // A worker holds it
    closed,  // Range written, or handed over and abandoned
    failed   // Closed abnormally; its range is incomplete
};

// A contiguous byte range of the resource plus its write progress.
// Invariant: start <= cursor <= end.
class Segment {
public:
    Segment(std::uint32_t id, std::uint64_t start, std::uint64_t end) noexcept;

    // Open this segment's own handle on the (already allocated) staging file
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Write a chunk at cursor. Bytes past end are dropped; returns how many were kept.
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write(std::span<const std::byte> chunk) noexcept;

    // Give up everything at and above new_end (split donor side)
    void shrink_to(std::uint64_t new_end) noexcept;

    // Take over a fresh range (split receiver side). Only valid once the
    // current range is fully written.
    void reassign(ByteRange range) noexcept;

    void close() noexcept;
    void fail(std::error_code ec) noexcept;

    [[nodiscard]] std::uint32_t id() const noexcept { return id_; }
    [[nodiscard]] std::uint64_t start() const noexcept { return start_; }
    [[nodiscard]] std::uint64_t end() const noexcept { return end_; }
    [[nodiscard]] std::uint64_t cursor() const noexcept { return cursor_; }
    [[nodiscard]] std::uint64_t remaining() const noexcept { return end_ - cursor_; }
    [[nodiscard]] ByteRange range() const noexcept { return {start_, end_}; }
    [[nodiscard]] ByteRange unclaimed() const noexcept { return {cursor_, end_}; }
    [[nodiscard]] SegmentStatus status() const noexcept { return status_; }
    [[nodiscard]] bool is_active() const noexcept { return status_ == SegmentStatus::active; }
    [[nodiscard]] const std::error_code& error() const noexcept { return error_; }

private:
    std::uint32_t id_;
    std::uint64_t start_;
    std::uint64_t end_;
    std::uint64_t cursor_;
    SegmentStatus status_{SegmentStatus::active};
    std::error_code error_;
    disk::FileWriter writer_;
};

} // namespace mdown::core
