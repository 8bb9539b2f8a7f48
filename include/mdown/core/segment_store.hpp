// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/segment.hpp>
#include <cstdint>
#include <cstddef>
#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace mdown::core {

// What a finishing worker should do next
enum class RebalanceAction : std::uint8_t {
    split,  // Restart against the range just donated to it
    close   // Nothing worth taking; the worker terminates
};

// Evenly spaced cut points: stop[i] = floor(total * i / count) for
// i in [0, count), followed by total. Pure function.
[[nodiscard]] std::vector<std::uint64_t> partition_stops(std::uint64_t total_length,
                                                         std::uint32_t count);

// Owns every segment of a job. Segments are reassigned, never added or
// removed, so the cardinality stays equal to the initial worker count.
class SegmentStore {
public:
    SegmentStore(std::uint64_t total_length, std::uint32_t count);

    // Non-copyable (segments own file handles)
    SegmentStore(const SegmentStore&) = delete;
    SegmentStore& operator=(const SegmentStore&) = delete;

    // Open one handle per segment on the already-allocated staging file
    [[nodiscard]] std::error_code open_all(std::string_view path) noexcept;

    // Active segment with the most remaining bytes; first one wins ties
    [[nodiscard]] std::optional<std::size_t> busiest() const noexcept;

    // Donate the upper half of donor's unclaimed range to receiver, which
    // must have nothing left to fetch.
    void split_into(std::size_t donor, std::size_t receiver) noexcept;

    // Decision taken whenever segment `index` has delivered its whole range
    [[nodiscard]] RebalanceAction rebalance(std::size_t index, std::uint64_t threshold);

    // Close segment `index` abnormally; its worker terminates
    void retire(std::size_t index, std::error_code ec);

    // Invoked exactly once, when the active count first reaches zero
    void on_drained(std::function<void()> cb) { on_drained_ = std::move(cb); }

    // True when the segment ranges plus the ranges already handed back
    // tile [0, total_length) with no gap and no overlap
    [[nodiscard]] bool is_partition() const;

    [[nodiscard]] std::size_t size() const noexcept { return segments_.size(); }
    [[nodiscard]] Segment& at(std::size_t index) { return segments_.at(index); }
    [[nodiscard]] const Segment& at(std::size_t index) const { return segments_.at(index); }
    [[nodiscard]] const std::vector<Segment>& segments() const noexcept { return segments_; }

    [[nodiscard]] std::uint64_t total_length() const noexcept { return total_length_; }
    [[nodiscard]] std::uint32_t active_count() const noexcept { return active_count_; }
    [[nodiscard]] std::uint32_t failed_count() const noexcept { return failed_count_; }
    [[nodiscard]] std::uint32_t split_count() const noexcept { return split_count_; }
    [[nodiscard]] bool drained() const noexcept { return active_count_ == 0; }
    [[nodiscard]] std::size_t finished_span_count() const noexcept { return finished_spans_.size(); }

private:
    void release();
    void record_finished(ByteRange range);

    std::uint64_t total_length_;
    std::vector<Segment> segments_;
    // Ranges given up by reassigned segments, coalesced where adjacent.
    // Only is_partition() reads them.
    std::vector<ByteRange> finished_spans_;
    std::uint32_t active_count_;
    std::uint32_t failed_count_{0};
    std::uint32_t split_count_{0};
    bool drained_signalled_{false};
    std::function<void()> on_drained_;
};

} // namespace mdown::core
