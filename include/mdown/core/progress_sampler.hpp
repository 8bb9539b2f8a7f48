// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstdint>

namespace mdown::core {

struct ProgressSample {
    std::uint64_t total_bytes{0};
    std::uint64_t written_bytes{0};
    std::uint32_t percent{0};    // Whole percent complete
    double kb_per_sec{0.0};      // Since the previous sample
};

// Turns the job's monotonically increasing written-bytes counter into
// throughput and percent complete. Purely observational.
class ProgressSampler {
public:
    using clock = std::chrono::steady_clock;

    ProgressSampler(std::uint64_t total_bytes, clock::time_point start) noexcept;

    [[nodiscard]] ProgressSample sample(std::uint64_t written_bytes, clock::time_point now) noexcept;

private:
    std::uint64_t total_bytes_;
    std::uint64_t last_written_{0};
    clock::time_point last_time_;
};

} // namespace mdown::core
