// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/disk/cache_file.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace spool::disk {

//=============================================================================
// CacheFile
//=============================================================================

std::expected<CacheFile, std::error_code>
CacheFile::open(std::string_view path, bool create) noexcept {
    CacheFile file;
    try {
        file.path_ = path;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }

    int flags = O_RDWR | O_CLOEXEC;
    if (create) flags |= O_CREAT;

    file.fd_ = ::open(file.path_.c_str(), flags, 0644);
    if (file.fd_ < 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::invalid_path));
    }

    return file;
}

CacheFile::~CacheFile() {
    close();
}

CacheFile::CacheFile(CacheFile&& other) noexcept
    : fd_(other.fd_)
    , path_(std::move(other.path_)) {
    other.fd_ = -1;
}

CacheFile& CacheFile::operator=(CacheFile&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        path_ = std::move(other.path_);
        other.fd_ = -1;
    }
    return *this;
}

std::expected<std::size_t, std::error_code>
CacheFile::write(std::uint64_t offset, const void* data, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    const auto* p = static_cast<const char*>(data);
    std::size_t written = 0;
    while (written < size) {
        auto n = ::pwrite(fd_, p + written, size - written,
                          static_cast<off_t>(offset + written));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::write_error));
        }
        if (n == 0) {
            return std::unexpected(make_error_code(DiskErrc::write_error));
        }
        written += static_cast<std::size_t>(n);
    }
    return written;
}

std::expected<std::size_t, std::error_code>
CacheFile::read(std::uint64_t offset, void* buffer, std::size_t size) noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }

    auto* p = static_cast<char*>(buffer);
    std::size_t total = 0;
    while (total < size) {
        auto n = ::pread(fd_, p + total, size - total,
                         static_cast<off_t>(offset + total));
        if (n < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
        }
        if (n == 0) break;  // EOF
        total += static_cast<std::size_t>(n);
    }
    return total;
}

std::error_code CacheFile::sync() noexcept {
    if (fd_ < 0) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fdatasync(fd_) != 0) {
        return errno_to_error_code(errno, DiskErrc::sync_error);
    }
    return {};
}

std::expected<std::uint64_t, std::error_code> CacheFile::size() const noexcept {
    if (fd_ < 0) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
    struct stat st{};
    if (::fstat(fd_, &st) != 0) {
        return std::unexpected(errno_to_error_code(errno, DiskErrc::read_error));
    }
    return static_cast<std::uint64_t>(st.st_size);
}

void CacheFile::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace spool::disk
