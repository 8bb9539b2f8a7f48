// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/download_coordinator.hpp>
#include <mdown/disk/file_writer.hpp>
#include <spdlog/spdlog.h>

namespace mdown::core {

DownloadCoordinator::DownloadCoordinator(Transport& transport, DownloadConfig config)
    : transport_(transport)
    , config_(std::move(config)) {}

std::string DownloadCoordinator::staging_path_for(const std::string& output_path,
                                                  const DownloadConfig& config) {
    return output_path + config.staging_suffix;
}

std::error_code DownloadCoordinator::run(const Url& url, std::string output_path) {
    if (state_ != JobState::idle) {
        return make_error_code(DownloadErrc::invalid_argument);
    }
    if (config_.connections == 0 || config_.connections > MAX_CONNECTIONS || output_path.empty()) {
        state_ = JobState::failed;
        return make_error_code(DownloadErrc::invalid_argument);
    }

    output_path_ = std::move(output_path);
    staging_path_ = staging_path_for(output_path_, config_);

    if (auto ec = prepare(url)) {
        state_ = JobState::failed;
        return ec;
    }

    state_ = JobState::downloading;
    spdlog::info("Downloading {} ({} bytes) with {} connections",
                 url_.str(), total_length_, config_.connections);

    workers_.reserve(store_->size());
    for (std::size_t i = 0; i < store_->size(); ++i) {
        workers_.push_back(std::make_unique<Worker>(
            i, transport_, url_, *store_, config_, total_written_));
    }
    for (auto& worker : workers_) {
        worker->start();
    }

    sampler_ = std::make_unique<ProgressSampler>(total_length_, ProgressSampler::clock::now());
    transport_.set_timer(config_.stats_interval, [this] { on_stats_timer(); });

    auto ec = transport_.run();
    transport_.cancel_timer();

    if (ec) {
        spdlog::error("Event loop stopped: {}", ec.message());
        state_ = JobState::failed;
        return ec;
    }

    return finish();
}

std::error_code DownloadCoordinator::prepare(const Url& url) {
    state_ = JobState::preparing;
    url_ = url;

    auto length = transport_.content_length(url_);
    if (!length) {
        spdlog::error("{}: {}", url_.str(), length.error().message());
        return length.error();
    }
    total_length_ = *length;

    // Created and sized exactly once; segments then open it without truncating
    if (auto ec = disk::FileWriter::allocate(staging_path_, total_length_)) {
        spdlog::error("{}: {}", staging_path_, ec.message());
        return ec;
    }

    store_ = std::make_unique<SegmentStore>(total_length_, config_.connections);
    if (auto ec = store_->open_all(staging_path_)) {
        spdlog::error("{}: {}", staging_path_, ec.message());
        return ec;
    }

    store_->on_drained([this] { on_drained(); });
    return {};
}

void DownloadCoordinator::on_drained() {
    ++completions_;
    transport_.stop();
}

void DownloadCoordinator::on_stats_timer() {
    if (!sampler_) return;

    auto sample = sampler_->sample(total_written_, ProgressSampler::clock::now());
    if (callback_) {
        callback_(sample);
    }
}

std::error_code DownloadCoordinator::finish() {
    if (!store_->drained()) {
        state_ = JobState::failed;
        return make_error_code(DownloadErrc::incomplete);
    }

    if (store_->failed_count() > 0) {
        spdlog::error("{} of {} segments failed; leaving {} in place",
                      store_->failed_count(), store_->size(), staging_path_);
        state_ = JobState::failed;
        return make_error_code(DownloadErrc::incomplete);
    }

    // Segment handles are closed; sync the data once through a fresh one
    disk::FileWriter writer;
    std::error_code sync_ec = writer.open(staging_path_);
    if (!sync_ec) {
        sync_ec = writer.flush();
    }
    writer.close();
    if (sync_ec) {
        spdlog::error("Cannot sync {}: {}", staging_path_, sync_ec.message());
        state_ = JobState::failed;
        return sync_ec;
    }

    if (auto ec = disk::commit(staging_path_, output_path_)) {
        spdlog::error("Cannot rename {} to {}: {}", staging_path_, output_path_, ec.message());
        state_ = JobState::failed;
        return ec;
    }

    state_ = JobState::completed;
    spdlog::info("Saved {} ({} bytes, {} splits)", output_path_, total_written_, store_->split_count());
    return {};
}

} // namespace mdown::core
