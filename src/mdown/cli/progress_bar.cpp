// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/cli/progress_bar.hpp>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace mdown::cli {

ProgressBar::ProgressBar(std::ostream& out)
    : out_(out) {}

void ProgressBar::update(const core::ProgressSample& sample) {
    std::string line = format(sample);

    // Pad over leftovers of a longer previous line
    std::size_t width = line.size();
    if (width < last_width_) {
        line.append(last_width_ - width, ' ');
    }
    last_width_ = width;

    out_ << line << '\r' << std::flush;
}

void ProgressBar::finish() {
    if (last_width_ == 0) return;
    out_ << '\n' << std::flush;
    last_width_ = 0;
}

void ProgressBar::clear() {
    if (last_width_ == 0) return;
    out_ << '\r' << std::string(last_width_, ' ') << '\r' << std::flush;
    last_width_ = 0;
}

std::string ProgressBar::format(const core::ProgressSample& sample) {
    std::ostringstream ss;
    ss << "Downloaded " << sample.percent << "% (Currently: "
       << std::fixed << std::setprecision(2) << sample.kb_per_sec << "KB/s)";
    return ss.str();
}

std::string ProgressBar::format_bytes(std::uint64_t bytes) {
    constexpr std::uint64_t KB = 1024;
    constexpr std::uint64_t MB = 1024 * KB;
    constexpr std::uint64_t GB = 1024 * MB;

    std::ostringstream ss;
    if (bytes >= GB) {
        ss << std::fixed << std::setprecision(2) << (static_cast<double>(bytes) / GB) << " GB";
    } else if (bytes >= MB) {
        ss << std::fixed << std::setprecision(1) << (static_cast<double>(bytes) / MB) << " MB";
    } else if (bytes >= KB) {
        ss << std::fixed << std::setprecision(0) << (static_cast<double>(bytes) / KB) << " KB";
    } else {
        ss << bytes << " B";
    }
    return ss.str();
}

} // namespace mdown::cli
