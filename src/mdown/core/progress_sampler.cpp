// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/core/progress_sampler.hpp>

namespace mdown::core {

ProgressSampler::ProgressSampler(std::uint64_t total_bytes, clock::time_point start) noexcept
    : total_bytes_(total_bytes)
    , last_time_(start) {}

ProgressSample ProgressSampler::sample(std::uint64_t written_bytes, clock::time_point now) noexcept {
    ProgressSample s;
    s.total_bytes = total_bytes_;
    s.written_bytes = written_bytes;

    if (total_bytes_ == 0) {
        s.percent = 100;
    } else {
        auto product = static_cast<unsigned __int128>(written_bytes) * 100;
        s.percent = static_cast<std::uint32_t>(product / total_bytes_);
    }

    std::chrono::duration<double> elapsed = now - last_time_;
    std::uint64_t delta = written_bytes >= last_written_ ? written_bytes - last_written_ : 0;
    if (elapsed.count() > 0.0) {
        s.kb_per_sec = static_cast<double>(delta) / (elapsed.count() * 1024.0);
    }

    last_written_ = written_bytes;
    last_time_ = now;
    return s;
}

} // namespace mdown::core
