// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <string>

namespace mdown::core {

// Half-open byte range [start, end)
struct ByteRange {
    std::uint64_t start{0};
    std::uint64_t end{0};

    [[nodiscard]] constexpr std::uint64_t size() const noexcept { return end > start ? end - start : 0; }
    [[nodiscard]] constexpr bool empty() const noexcept { return end <= start; }

    // Inclusive "first-last" form used by the HTTP Range header
    [[nodiscard]] std::string to_http() const {
        return std::to_string(start) + "-" + std::to_string(end - 1);
    }

    constexpr bool operator==(const ByteRange&) const = default;
};

} // namespace mdown::core
