// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/config.hpp>
#include <mdown/core/progress_sampler.hpp>
#include <mdown/core/segment_store.hpp>
#include <mdown/core/transport.hpp>
#include <mdown/core/url.hpp>
#include <mdown/core/worker.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace mdown::core {

// Overall job state
enum class JobState : std::uint8_t {
    idle,        // Not started
    preparing,   // Querying length, allocating the staging file
    downloading, // Workers running
    completed,   // Renamed into place
    failed       // Stopped; staging file left behind
};

// Progress event callback
using ProgressCallback = std::function<void(const ProgressSample&)>;

// Top-level orchestrator for one download: partitions the resource,
// starts one worker per segment, and renames the staging file once the
// last worker terminates with every segment intact.
class DownloadCoordinator {
public:
    DownloadCoordinator(Transport& transport, DownloadConfig config);

    // Non-copyable, non-movable (workers hold references into us)
    DownloadCoordinator(const DownloadCoordinator&) = delete;
    DownloadCoordinator& operator=(const DownloadCoordinator&) = delete;

    // Download url to output_path. Blocks until every worker has terminated.
    [[nodiscard]] std::error_code run(const Url& url, std::string output_path);

    void callback(ProgressCallback cb) { callback_ = std::move(cb); }

    [[nodiscard]] static std::string staging_path_for(const std::string& output_path,
                                                      const DownloadConfig& config);

    [[nodiscard]] JobState state() const noexcept { return state_; }
    [[nodiscard]] const DownloadConfig& config() const noexcept { return config_; }
    [[nodiscard]] std::uint64_t total_length() const noexcept { return total_length_; }
    [[nodiscard]] std::uint64_t total_written() const noexcept { return total_written_; }
    [[nodiscard]] const std::string& output_path() const noexcept { return output_path_; }
    [[nodiscard]] const std::string& staging_path() const noexcept { return staging_path_; }
    [[nodiscard]] std::uint32_t completions() const noexcept { return completions_; }

    // Null until run() has partitioned the resource
    [[nodiscard]] const SegmentStore* store() const noexcept { return store_.get(); }

private:
    [[nodiscard]] std::error_code prepare(const Url& url);
    void on_drained();
    void on_stats_timer();
    [[nodiscard]] std::error_code finish();

    Transport& transport_;
    DownloadConfig config_;
    JobState state_{JobState::idle};

    Url url_;
    std::string output_path_;
    std::string staging_path_;
    std::uint64_t total_length_{0};
    std::uint64_t total_written_{0};
    std::uint32_t completions_{0};

    std::unique_ptr<SegmentStore> store_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::unique_ptr<ProgressSampler> sampler_;
    ProgressCallback callback_;
};

} // namespace mdown::core
