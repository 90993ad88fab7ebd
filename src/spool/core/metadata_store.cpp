// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/metadata_store.hpp>
#include <spool/core/error.hpp>
#include <spool/disk/byte_store.hpp>
#include <spool/disk/error.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace spool::core {

namespace fs = std::filesystem;

//=============================================================================
// FileMetadataBackend
//=============================================================================

FileMetadataBackend::FileMetadataBackend(std::string directory)
    : directory_(std::move(directory)) {}

std::expected<std::unique_ptr<FileMetadataBackend>, std::error_code>
FileMetadataBackend::open(std::string_view directory) noexcept {
    try {
        std::error_code ec;
        fs::create_directories(fs::path(directory), ec);
        if (ec) {
            return std::unexpected(disk::errno_to_error_code(ec.value(), disk::DiskErrc::invalid_path));
        }
        return std::unique_ptr<FileMetadataBackend>(new FileMetadataBackend(std::string(directory)));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::invalid_path));
    }
}

std::string FileMetadataBackend::path_for(std::string_view key) const {
    return (fs::path(directory_) / (disk::storage_name(key) + std::string(EXTENSION))).string();
}

std::expected<std::string, std::error_code>
FileMetadataBackend::load(std::string_view key) noexcept {
    try {
        std::ifstream file(path_for(key), std::ios::binary);
        if (!file) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }

        std::string document{std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
        if (file.bad()) {
            return std::unexpected(make_error_code(disk::DiskErrc::read_error));
        }
        return document;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code FileMetadataBackend::save(std::string_view key, std::string_view document) noexcept {
    try {
        std::string path = path_for(key);
        std::string tmp = path + ".tmp";

        {
            std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
            file.write(document.data(), static_cast<std::streamsize>(document.size()));
            file.flush();
            if (!file) {
                return make_error_code(disk::DiskErrc::write_error);
            }
        }

        // Readers see either the old document or the new one
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            fs::remove(tmp, ec);
            return make_error_code(disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code FileMetadataBackend::remove(std::string_view key) noexcept {
    try {
        std::error_code ec;
        fs::remove(path_for(key), ec);
        if (ec) {
            return disk::errno_to_error_code(ec.value(), disk::DiskErrc::write_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code FileMetadataBackend::remove_all() noexcept {
    try {
        std::error_code ec;
        for (const auto& entry : fs::directory_iterator(directory_, ec)) {
            const std::string name = entry.path().filename().string();
            if (!name.ends_with(EXTENSION) && !name.ends_with(".meta.json.tmp")) continue;

            std::error_code remove_ec;
            fs::remove(entry.path(), remove_ec);
            if (remove_ec) {
                return disk::errno_to_error_code(remove_ec.value(), disk::DiskErrc::write_error);
            }
        }
        if (ec) {
            return disk::errno_to_error_code(ec.value(), disk::DiskErrc::read_error);
        }
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

//=============================================================================
// MemoryMetadataBackend
//=============================================================================

std::expected<std::string, std::error_code>
MemoryMetadataBackend::load(std::string_view key) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = documents_.find(key);
        if (it == documents_.end()) {
            return std::unexpected(make_error_code(disk::DiskErrc::file_not_found));
        }
        return it->second;
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(disk::DiskErrc::read_error));
    }
}

std::error_code MemoryMetadataBackend::save(std::string_view key, std::string_view document) noexcept {
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        documents_.insert_or_assign(std::string(key), std::string(document));
        ++saves_;
        return {};
    } catch (const std::exception&) {
        return make_error_code(disk::DiskErrc::write_error);
    }
}

std::error_code MemoryMetadataBackend::remove(std::string_view key) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = documents_.find(key);
    if (it != documents_.end()) {
        documents_.erase(it);
    }
    return {};
}

std::error_code MemoryMetadataBackend::remove_all() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_.clear();
    return {};
}

void MemoryMetadataBackend::put_raw(std::string_view key, std::string document) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_.insert_or_assign(std::string(key), std::move(document));
}

std::size_t MemoryMetadataBackend::save_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return saves_;
}

//=============================================================================
// MetadataStore
//=============================================================================

MetadataStore::MetadataStore(MetadataBackend& backend)
    : backend_(backend) {
    writer_ = std::jthread([this](std::stop_token stop) { run(stop); });
}

MetadataStore::~MetadataStore() {
    // The writer drains the queue before it exits
    writer_.request_stop();
    if (writer_.joinable()) {
        writer_.join();
    }
}

std::expected<std::optional<PersistedRecord>, std::error_code>
MetadataStore::load(std::string_view key) noexcept {
    try {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(key);
            if (it != pending_.end()) {
                return std::optional<PersistedRecord>(it->second);
            }
        }

        auto document = backend_.load(key);
        if (!document) {
            if (document.error() == disk::DiskErrc::file_not_found) {
                return std::optional<PersistedRecord>{};
            }
            return std::unexpected(document.error());
        }

        auto record = PersistedRecord::from_json(*document);
        if (!record) {
            return std::unexpected(record.error());
        }
        if (record->key != key) {
            // Hash collision or a file copied under the wrong name
            return std::unexpected(make_error_code(CacheErrc::cache_corruption));
        }
        return std::optional<PersistedRecord>(std::move(*record));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(CacheErrc::storage_read_error));
    }
}

void MetadataStore::persist(PersistedRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto seen = accepted_.find(record.key);
        if (seen != accepted_.end() && record.revision <= seen->second) {
            return;
        }
        accepted_.insert_or_assign(record.key, record.revision);
        std::string key = record.key;
        pending_.insert_or_assign(std::move(key), std::move(record));
    }
    work_cv_.notify_one();
}

void MetadataStore::sync() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return pending_.empty() && !in_flight_; });
}

std::error_code MetadataStore::remove(std::string_view key) noexcept {
    try {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = pending_.find(key);
        if (it != pending_.end()) {
            pending_.erase(it);
        }
        auto seen = accepted_.find(key);
        if (seen != accepted_.end()) {
            accepted_.erase(seen);
        }
        idle_cv_.wait(lock, [this, key] { return !in_flight_ || *in_flight_ != key; });

        // Still holding the lock: the writer cannot start another save
        return backend_.remove(key);
    } catch (const std::exception&) {
        return make_error_code(CacheErrc::storage_write_error);
    }
}

std::error_code MetadataStore::remove_all() noexcept {
    try {
        std::unique_lock<std::mutex> lock(mutex_);
        pending_.clear();
        accepted_.clear();
        idle_cv_.wait(lock, [this] { return !in_flight_.has_value(); });
        return backend_.remove_all();
    } catch (const std::exception&) {
        return make_error_code(CacheErrc::storage_write_error);
    }
}

void MetadataStore::run(std::stop_token stop) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, stop, [this] { return !pending_.empty(); });
        if (pending_.empty()) {
            if (stop.stop_requested()) break;
            continue;
        }

        auto node = pending_.extract(pending_.begin());
        in_flight_ = node.key();
        lock.unlock();

        std::error_code ec;
        try {
            ec = backend_.save(node.key(), node.mapped().to_json());
        } catch (const std::exception& e) {
            spdlog::warn("metadata for {} not serializable: {}", node.key(), e.what());
            ec = make_error_code(CacheErrc::storage_write_error);
        }
        if (ec) {
            spdlog::warn("failed to persist metadata for {}: {}", node.key(), ec.message());
        } else {
            spdlog::debug("persisted metadata for {} (revision {})", node.key(), node.mapped().revision);
        }

        lock.lock();
        in_flight_.reset();
        idle_cv_.notify_all();
    }
}

} // namespace spool::core
