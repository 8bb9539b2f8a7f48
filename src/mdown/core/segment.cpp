// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/segment.hpp>
#include <algorithm>

namespace mdown::core {

Segment::Segment(std::uint32_t id, std::uint64_t start, std::uint64_t end) noexcept
    : id_(id)
    , start_(start)
    , end_(std::max(start, end))
    , cursor_(start) {}

std::error_code Segment::open(std::string_view path) noexcept {
    return writer_.open(path);
}

std::expected<std::size_t, std::error_code>
Segment::write(std::span<const std::byte> chunk) noexcept {
    if (status_ != SegmentStatus::active) {
        return std::unexpected(make_error_code(DownloadErrc::invalid_range));
    }

    auto take = static_cast<std::size_t>(
        std::min<std::uint64_t>(chunk.size(), remaining()));
    if (take == 0) {
        return 0;
    }

    // Explicit offset: the handle's own position is never relied on
    auto ec = writer_.write(cursor_, chunk.data(), take);
    if (ec) {
        return std::unexpected(ec);
    }

    cursor_ += take;
    return take;
}

void Segment::shrink_to(std::uint64_t new_end) noexcept {
    end_ = std::clamp(new_end, cursor_, end_);
}

void Segment::reassign(ByteRange range) noexcept {
    start_ = range.start;
    cursor_ = range.start;
    end_ = std::max(range.start, range.end);
}

void Segment::close() noexcept {
    writer_.close();
    status_ = SegmentStatus::closed;
}

void Segment::fail(std::error_code ec) noexcept {
    writer_.close();
    error_ = ec;
    status_ = SegmentStatus::failed;
}

} // namespace mdown::core
