// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/core/progress_sampler.hpp>
#include <cstdint>
#include <iosfwd>
#include <string>

namespace mdown::cli {

// Single progress line, overwritten in place with '\r'
class ProgressBar {
public:
    explicit ProgressBar(std::ostream& out);

    void update(const core::ProgressSample& sample);

    // Terminate the line (if one was drawn) so later output starts clean
    void finish();

    // Blank out the current line
    void clear();

    // "Downloaded 42% (Currently: 123.45KB/s)"
    [[nodiscard]] static std::string format(const core::ProgressSample& sample);
    [[nodiscard]] static std::string format_bytes(std::uint64_t bytes);

private:
    std::ostream& out_;
    std::size_t last_width_{0};
};

} // namespace mdown::cli
