// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/disk/cache_file.hpp>
#include <spool/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace spool::disk {

// Durable byte-addressable storage, one address space per key.
// Implementations must allow concurrent calls at disjoint offsets.
class ByteStore {
public:
    virtual ~ByteStore() = default;

    // Store bytes at offset; returns only after the bytes are durable
    [[nodiscard]] virtual std::error_code
    write(std::string_view key, std::uint64_t offset, std::span<const std::byte> data) noexcept = 0;

    // Read into `out`; returns the number of bytes read (short at end of data)
    [[nodiscard]] virtual std::expected<std::size_t, std::error_code>
    read(std::string_view key, std::uint64_t offset, std::span<std::byte> out) noexcept = 0;

    // Drop all bytes stored under key (absent key is not an error)
    [[nodiscard]] virtual std::error_code remove(std::string_view key) noexcept = 0;

    [[nodiscard]] virtual std::error_code remove_all() noexcept = 0;

    // Bytes occupied by all keys
    [[nodiscard]] virtual std::uint64_t size_on_disk() const noexcept = 0;
};

// Filesystem-safe, stable name for a cache key (FNV-1a 64, hex)
[[nodiscard]] std::string storage_name(std::string_view key);

// One sparse file per key: <dir>/<storage_name>.data
class FileByteStore final : public ByteStore {
public:
    static constexpr std::string_view EXTENSION = ".data";

    static std::expected<std::unique_ptr<FileByteStore>, std::error_code>
    open(std::string_view directory, bool sync_writes = true) noexcept;

    [[nodiscard]] std::error_code
    write(std::string_view key, std::uint64_t offset, std::span<const std::byte> data) noexcept override;

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::string_view key, std::uint64_t offset, std::span<std::byte> out) noexcept override;

    [[nodiscard]] std::error_code remove(std::string_view key) noexcept override;
    [[nodiscard]] std::error_code remove_all() noexcept override;
    [[nodiscard]] std::uint64_t size_on_disk() const noexcept override;

    [[nodiscard]] const std::string& directory() const noexcept { return directory_; }

private:
    FileByteStore(std::string directory, bool sync_writes);

    [[nodiscard]] std::expected<std::shared_ptr<CacheFile>, std::error_code>
    file_for(std::string_view key, bool create) noexcept;

    [[nodiscard]] std::string path_for(std::string_view key) const;

    std::string directory_;
    bool sync_writes_;
    std::map<std::string, std::shared_ptr<CacheFile>, std::less<>> files_;
    mutable std::mutex mutex_;  // Protects files_ only, never held during I/O
};

// In-process store for tests and ephemeral caches
class MemoryByteStore final : public ByteStore {
public:
    [[nodiscard]] std::error_code
    write(std::string_view key, std::uint64_t offset, std::span<const std::byte> data) noexcept override;

    [[nodiscard]] std::expected<std::size_t, std::error_code>
    read(std::string_view key, std::uint64_t offset, std::span<std::byte> out) noexcept override;

    [[nodiscard]] std::error_code remove(std::string_view key) noexcept override;
    [[nodiscard]] std::error_code remove_all() noexcept override;
    [[nodiscard]] std::uint64_t size_on_disk() const noexcept override;

    [[nodiscard]] bool contains(std::string_view key) const noexcept;

private:
    std::map<std::string, std::vector<std::byte>, std::less<>> blobs_;
    mutable std::mutex mutex_;
};

} // namespace spool::disk
