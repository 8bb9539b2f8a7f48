// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <mdown/disk/error.hpp>
#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace mdown::disk {

// Positional writer over an existing file. Each segment owns one, so
// several writers may target the same path at disjoint offsets.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    // Non-copyable, movable
    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create (or truncate) path and size it to exactly `size` bytes.
    // Called once per job, before any writer is opened.
    [[nodiscard]] static std::error_code allocate(std::string_view path, std::uint64_t size) noexcept;

    // Open an existing file read/write. Never truncates.
    [[nodiscard]] std::error_code open(std::string_view path) noexcept;

    // Write all of data at offset
    [[nodiscard]] std::error_code write(std::uint64_t offset,
                                        const void* data,
                                        std::size_t size) noexcept;

    [[nodiscard]] std::error_code flush() noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    int fd_{-1};
    std::string path_;
};

// Atomically rename the staging file to its final name
[[nodiscard]] std::error_code commit(std::string_view staging_path, std::string_view final_path) noexcept;

} // namespace mdown::disk
