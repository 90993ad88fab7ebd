// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/disk/error.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <expected>

namespace spool::disk {

// Positional-I/O file handle. Reads and writes carry explicit offsets, so
// concurrent calls at disjoint offsets need no locking.
class CacheFile {
public:
    // Open for reading and writing; never truncates
    static std::expected<CacheFile, std::error_code>
    open(std::string_view path, bool create = true) noexcept;

    ~CacheFile();

    // Non-copyable, movable
    CacheFile(const CacheFile&) = delete;
    CacheFile& operator=(const CacheFile&) = delete;
    CacheFile(CacheFile&&) noexcept;
    CacheFile& operator=(CacheFile&&) noexcept;

    // Write all of `size` bytes at offset (short writes are retried)
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    write(std::uint64_t offset, const void* data, std::size_t size) noexcept;

    // Read up to `size` bytes at offset; fewer only at end of file
    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::uint64_t offset, void* buffer, std::size_t size) noexcept;

    // Flush file data to the device
    [[nodiscard]] std::error_code sync() noexcept;

    // Current size in bytes
    [[nodiscard]] std::expected<std::uint64_t, std::error_code> size() const noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }

private:
    CacheFile() = default;

    int fd_{-1};
    std::string path_;
};

} // namespace spool::disk
