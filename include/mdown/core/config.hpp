// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>

namespace mdown::core {

constexpr std::uint32_t DEFAULT_NUM_CONNECTIONS = 4;
constexpr std::uint32_t MAX_CONNECTIONS = 1024;
constexpr std::uint64_t SPLIT_THRESHOLD_BYTES = 4'096 * 2;         // Below this, splitting is not worth a new request
constexpr std::chrono::seconds STATS_INTERVAL{3};

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t RETRY_COUNT = 3;

constexpr std::string_view STAGING_SUFFIX = ".mdown-intermediate";

constexpr std::size_t RECEIVE_BUFFER_SIZE = 256 * 1024;            // 256 KB

// Upper bound on curl_multi_poll waits so timers stay responsive
constexpr std::chrono::milliseconds MAX_POLL_WAIT{250};

// Per-job tunables. Defaults come from the constants above; a settings
// file and then the command line may override them.
struct DownloadConfig {
    std::uint32_t connections{DEFAULT_NUM_CONNECTIONS};
    std::uint64_t split_threshold{SPLIT_THRESHOLD_BYTES};
    std::chrono::milliseconds stats_interval{STATS_INTERVAL};
    std::uint32_t max_retries{RETRY_COUNT};          // Consecutive failures without progress
    std::chrono::seconds connect_timeout{CONNECTION_TIMEOUT_SEC};
    std::string staging_suffix{STAGING_SUFFIX};
};

} // namespace mdown::core
