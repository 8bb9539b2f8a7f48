// Copyright (c) 2026 changcheng967. All rights reserved.

#include <mdown/disk/file_writer.hpp>
#include <cerrno>
#include <cstdio>
#include <utility>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace mdown::disk {

std::error_code errno_to_error_code(int err) noexcept {
    switch (err) {
        case 0:             return {};
        case ENOENT:        return make_error_code(DiskErrc::file_not_found);
        case EACCES:
        case EPERM:
        case EROFS:         return make_error_code(DiskErrc::access_denied);
        case ENOSPC:
        case EDQUOT:
        case EFBIG:         return make_error_code(DiskErrc::disk_full);
        case ENAMETOOLONG:
        case ENOTDIR:
        case EISDIR:
        case EINVAL:        return make_error_code(DiskErrc::invalid_path);
        case ESPIPE:        return make_error_code(DiskErrc::seek_error);
        case EBADF:         return make_error_code(DiskErrc::handle_invalid);
        case EXDEV:         return make_error_code(DiskErrc::rename_error);
        default:            return make_error_code(DiskErrc::write_error);
    }
}

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    close();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::allocate(std::string_view path, std::uint64_t size) noexcept {
    std::string p(path);
    int fd = ::open(p.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return errno_to_error_code(errno);
    }

    std::error_code ec;
    if (::ftruncate(fd, static_cast<off_t>(size)) != 0) {
        ec = errno_to_error_code(errno);
    }
    if (::close(fd) != 0 && !ec) {
        ec = errno_to_error_code(errno);
    }
    return ec;
}

std::error_code FileWriter::open(std::string_view path) noexcept {
    close();
    path_ = path;

    // No O_TRUNC: other segments may already have written into this file
    fd_ = ::open(path_.c_str(), O_RDWR | O_CLOEXEC);
    if (fd_ < 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

std::error_code FileWriter::write(std::uint64_t offset,
                                  const void* data,
                                  std::size_t size) noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::pwrite(fd_, p, size, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno_to_error_code(errno);
        }
        p += n;
        offset += static_cast<std::uint64_t>(n);
        size -= static_cast<std::size_t>(n);
    }
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::error_code commit(std::string_view staging_path, std::string_view final_path) noexcept {
    std::string from(staging_path);
    std::string to(final_path);
    if (std::rename(from.c_str(), to.c_str()) != 0) {
        return errno_to_error_code(errno);
    }
    return {};
}

} // namespace mdown::disk
