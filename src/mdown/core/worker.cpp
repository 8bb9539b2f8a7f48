// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/worker.hpp>
#include <spdlog/spdlog.h>

namespace mdown::core {

Worker::Worker(std::size_t index,
               Transport& transport,
               const Url& url,
               SegmentStore& store,
               const DownloadConfig& config,
               std::uint64_t& total_written) noexcept
    : index_(index)
    , transport_(transport)
    , url_(url)
    , store_(store)
    , config_(config)
    , total_written_(total_written) {}

void Worker::start() {
    const auto& seg = store_.at(index_);
    if (!seg.is_active()) return;

    // Nothing to request; go straight to the end-of-stream decision
    if (seg.remaining() == 0) {
        transport_.post([this] { on_end({}); });
        return;
    }

    ++fetches_;
    transport_.fetch(url_, seg.unclaimed(),
                     [this](std::span<const std::byte> chunk) { return on_chunk(chunk); },
                     [this](std::error_code ec) { on_end(ec); });
}

bool Worker::on_chunk(std::span<const std::byte> chunk) {
    auto& seg = store_.at(index_);

    auto written = seg.write(chunk);
    if (!written) {
        write_error_ = written.error();
        return false;
    }

    if (*written > 0) {
        total_written_ += *written;
        failures_ = 0;
    }

    // A split may have moved end below the range this stream was asked for
    return seg.remaining() > 0;
}

void Worker::on_end(std::error_code ec) {
    auto& seg = store_.at(index_);
    if (!seg.is_active()) return;

    if (write_error_) {
        spdlog::error("Segment {}: write at offset {} failed: {}",
                      index_, seg.cursor(), write_error_.message());
        store_.retire(index_, write_error_);
        return;
    }

    if (seg.remaining() == 0) {
        if (store_.rebalance(index_, config_.split_threshold) == RebalanceAction::split) {
            start();
        }
        return;
    }

    // Stream ended before end: never treated as delivered
    if (!ec) {
        ec = make_error_code(DownloadErrc::connection_lost);
    }

    if (is_permanent(ec)) {
        spdlog::error("Segment {}: [{}, {}) failed: {}", index_, seg.cursor(), seg.end(), ec.message());
        store_.retire(index_, ec);
        return;
    }

    if (failures_ >= config_.max_retries) {
        spdlog::error("Segment {}: giving up on [{}, {}) after {} attempts: {}",
                      index_, seg.cursor(), seg.end(), failures_ + 1, ec.message());
        store_.retire(index_, make_error_code(DownloadErrc::retries_exhausted));
        return;
    }

    ++failures_;
    spdlog::warn("Segment {}: {} at offset {} ({} bytes left), retry {}/{}",
                 index_, ec.message(), seg.cursor(), seg.remaining(), failures_, config_.max_retries);
    transport_.post([this] { start(); });
}

bool Worker::is_permanent(std::error_code ec) noexcept {
    return ec == DownloadErrc::not_found
        || ec == DownloadErrc::invalid_range
        || ec == DownloadErrc::permission_denied
        || ec == DownloadErrc::invalid_url
        || ec == DownloadErrc::unexpected_status;
}

} // namespace mdown::core
