// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/segment_store.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace mdown::core {

std::vector<std::uint64_t> partition_stops(std::uint64_t total_length, std::uint32_t count) {
    std::vector<std::uint64_t> stops;
    if (count == 0) {
        return stops;
    }

    stops.reserve(count + 1);
    for (std::uint32_t i = 0; i < count; ++i) {
        // 128-bit product: total * i must not overflow for multi-terabyte resources
        auto product = static_cast<unsigned __int128>(total_length) * i;
        stops.push_back(static_cast<std::uint64_t>(product / count));
    }
    stops.push_back(total_length);
    return stops;
}

//=============================================================================
// SegmentStore
//=============================================================================

SegmentStore::SegmentStore(std::uint64_t total_length, std::uint32_t count)
    : total_length_(total_length)
    , active_count_(count) {
    auto stops = partition_stops(total_length, count);
    segments_.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        segments_.emplace_back(i, stops[i], stops[i + 1]);
    }
}

std::error_code SegmentStore::open_all(std::string_view path) noexcept {
    for (auto& seg : segments_) {
        if (auto ec = seg.open(path)) {
            return ec;
        }
    }
    return {};
}

std::optional<std::size_t> SegmentStore::busiest() const noexcept {
    std::optional<std::size_t> best;
    std::uint64_t most_remaining = 0;

    for (std::size_t i = 0; i < segments_.size(); ++i) {
        const auto& seg = segments_[i];
        if (!seg.is_active()) continue;

        // Strict comparison keeps the first of equal candidates
        if (!best || seg.remaining() > most_remaining) {
            best = i;
            most_remaining = seg.remaining();
        }
    }
    return best;
}

void SegmentStore::split_into(std::size_t donor, std::size_t receiver) noexcept {
    auto& busy = segments_[donor];
    auto& idle = segments_[receiver];

    std::uint64_t old_end = busy.end();
    std::uint64_t midpoint = busy.cursor() + busy.remaining() / 2;

    record_finished(idle.range());

    busy.shrink_to(midpoint);
    idle.reassign({midpoint, old_end});
    ++split_count_;
}

RebalanceAction SegmentStore::rebalance(std::size_t index, std::uint64_t threshold) {
    auto donor = busiest();

    // A zero threshold would split empty ranges forever
    std::uint64_t floor = std::max<std::uint64_t>(threshold, 1);

    if (!donor || segments_[*donor].remaining() < floor) {
        spdlog::debug("Segment {} closing ({} connections left)", index, active_count_ - 1);
        segments_[index].close();
        release();
        return RebalanceAction::close;
    }

    split_into(*donor, index);
    const auto& busy = segments_[*donor];
    const auto& idle = segments_[index];
    spdlog::debug("Split segment {} -> {}: [{}, {}) keeps, [{}, {}) donated",
                  *donor, index, busy.cursor(), busy.end(), idle.start(), idle.end());
    return RebalanceAction::split;
}

void SegmentStore::retire(std::size_t index, std::error_code ec) {
    auto& seg = segments_[index];
    if (!seg.is_active()) return;

    seg.fail(ec);
    ++failed_count_;
    release();
}

void SegmentStore::release() {
    if (active_count_ == 0) return;

    if (--active_count_ == 0 && !drained_signalled_) {
        drained_signalled_ = true;
        if (on_drained_) {
            on_drained_();
        }
    }
}

void SegmentStore::record_finished(ByteRange range) {
    if (range.empty()) return;

    // Spans already stored never touch each other, so one pass suffices
    for (auto it = finished_spans_.begin(); it != finished_spans_.end();) {
        if (it->end == range.start || it->start == range.end) {
            range = {std::min(it->start, range.start), std::max(it->end, range.end)};
            it = finished_spans_.erase(it);
        } else {
            ++it;
        }
    }
    finished_spans_.push_back(range);
}

bool SegmentStore::is_partition() const {
    std::vector<ByteRange> spans = finished_spans_;
    for (const auto& seg : segments_) {
        // Empty ranges cover nothing and may sit anywhere
        if (!seg.range().empty()) {
            spans.push_back(seg.range());
        }
    }

    std::sort(spans.begin(), spans.end(), [](const ByteRange& a, const ByteRange& b) {
        return a.start != b.start ? a.start < b.start : a.end < b.end;
    });

    std::uint64_t expected = 0;
    for (const auto& span : spans) {
        if (span.start != expected) return false;
        expected = span.end;
    }
    return expected == total_length_;
}

} // namespace mdown::core
