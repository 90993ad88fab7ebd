// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/disk/byte_store.hpp>
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <sys/stat.h>

namespace spool::disk {

namespace fs = std::filesystem;

std::string storage_name(std::string_view key) {
    std::uint64_t hash = 14695981039346656037ULL;
    for (char c : key) {
        hash ^= static_cast<unsigned char>(c);
        hash *= 1099511628211ULL;
    }

    constexpr char HEX[] = "0123456789abcdef";
    std::string name(16, '0');
    for (int i = 15; i >= 0; --i) {
        name[static_cast<std::size_t>(i)] = HEX[hash & 0xF];
        hash >>= 4;
    }
    return name;
}

//=============================================================================
// FileByteStore
//=============================================================================

FileByteStore::FileByteStore(std::string directory, bool sync_writes)
    : directory_(std::move(directory))
    , sync_writes_(sync_writes) {}

std::expected<std::unique_ptr<FileByteStore>, std::error_code>
FileByteStore::open(std::string_view directory, bool sync_writes) noexcept {
    try {
        std::error_code ec;
        fs::create_directories(fs::path(directory), ec);
        if (ec) {
            return std::unexpected(errno_to_error_code(ec.value(), DiskErrc::invalid_path));
        }
        return std::unique_ptr<FileByteStore>(new FileByteStore(std::string(directory), sync_writes));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
}

std::string FileByteStore::path_for(std::string_view key) const {
    return (fs::path(directory_) / (storage_name(key) + std::string(EXTENSION))).string();
}

std::expected<std::shared_ptr<CacheFile>, std::error_code>
FileByteStore::file_for(std::string_view key, bool create) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(key);
        if (it != files_.end()) {
            return it->second;
        }

        auto file = CacheFile::open(path_for(key), create);
        if (!file) {
            return std::unexpected(file.error());
        }
        auto handle = std::make_shared<CacheFile>(std::move(*file));
        files_.emplace(std::string(key), handle);
        return handle;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(DiskErrc::handle_invalid));
    }
}

std::error_code FileByteStore::write(std::string_view key, std::uint64_t offset,
                                     std::span<const std::byte> data) noexcept {
    auto file = file_for(key, true);
    if (!file) {
        return file.error();
    }

    auto result = (*file)->write(offset, data.data(), data.size());
    if (!result) {
        return result.error();
    }

    if (sync_writes_) {
        return (*file)->sync();
    }
    return {};
}

std::expected<std::size_t, std::error_code>
FileByteStore::read(std::string_view key, std::uint64_t offset, std::span<std::byte> out) noexcept {
    auto file = file_for(key, false);
    if (!file) {
        return std::unexpected(file.error());
    }
    return (*file)->read(offset, out.data(), out.size());
}

std::error_code FileByteStore::remove(std::string_view key) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(key);
            if (it != files_.end()) {
                it->second->close();
                files_.erase(it);
            }
        }

        std::error_code ec;
        fs::remove(path_for(key), ec);
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::error_code FileByteStore::remove_all() noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (auto& [key, file] : files_) {
                file->close();
            }
            files_.clear();
        }

        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(directory_, ec)) {
            if (entry.path().extension() == EXTENSION) {
                std::error_code remove_ec;
                fs::remove(entry.path(), remove_ec);
                if (remove_ec) {
                    return errno_to_error_code(remove_ec.value(), DiskErrc::write_error);
                }
            }
        }
        if (ec) {
            return errno_to_error_code(ec.value(), DiskErrc::read_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::write_error);
    }
}

std::uint64_t FileByteStore::size_on_disk() const noexcept {
    std::uint64_t total = 0;
    try {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(directory_, ec)) {
            if (entry.path().extension() != EXTENSION) continue;

            // Allocated blocks, not logical size: the files are sparse
            struct stat st{};
            if (::stat(entry.path().c_str(), &st) == 0) {
                total += static_cast<std::uint64_t>(st.st_blocks) * 512;
            }
        }
    } catch (const std::exception&) {
        return total;
    }
    return total;
}

//=============================================================================
// MemoryByteStore
//=============================================================================

std::error_code MemoryByteStore::write(std::string_view key, std::uint64_t offset,
                                       std::span<const std::byte> data) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blobs_.find(key);
        if (it == blobs_.end()) {
            it = blobs_.emplace(std::string(key), std::vector<std::byte>{}).first;
        }

        auto& blob = it->second;
        if (blob.size() < offset + data.size()) {
            blob.resize(offset + data.size());
        }
        std::memcpy(blob.data() + offset, data.data(), data.size());
        return {};
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::disk_full);
    }
}

std::expected<std::size_t, std::error_code>
MemoryByteStore::read(std::string_view key, std::uint64_t offset, std::span<std::byte> out) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return std::unexpected(make_error_code(DiskErrc::file_not_found));
    }

    const auto& blob = it->second;
    if (offset >= blob.size()) return 0;

    std::size_t n = std::min<std::size_t>(out.size(), blob.size() - offset);
    std::memcpy(out.data(), blob.data() + offset, n);
    return n;
}

std::error_code MemoryByteStore::remove(std::string_view key) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(key);
    if (it != blobs_.end()) {
        blobs_.erase(it);
    }
    return {};
}

std::error_code MemoryByteStore::remove_all() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_.clear();
    return {};
}

std::uint64_t MemoryByteStore::size_on_disk() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t total = 0;
    for (const auto& [key, blob] : blobs_) {
        total += blob.size();
    }
    return total;
}

bool MemoryByteStore::contains(std::string_view key) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.find(key) != blobs_.end();
}

} // namespace spool::disk
