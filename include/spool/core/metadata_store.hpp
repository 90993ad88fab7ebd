// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/content_meta.hpp>
#include <condition_variable>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>

namespace spool::core {

// Key -> JSON document persistence
class MetadataBackend {
public:
    virtual ~MetadataBackend() = default;

    // DiskErrc::file_not_found if nothing is stored under key
    [[nodiscard]] virtual std::expected<std::string, std::error_code>
    load(std::string_view key) noexcept = 0;

    // Replace the document stored under key
    [[nodiscard]] virtual std::error_code
    save(std::string_view key, std::string_view document) noexcept = 0;

    [[nodiscard]] virtual std::error_code remove(std::string_view key) noexcept = 0;
    [[nodiscard]] virtual std::error_code remove_all() noexcept = 0;
};

// <dir>/<storage_name>.meta.json, replaced atomically via temp file + rename
class FileMetadataBackend final : public MetadataBackend {
public:
    static constexpr std::string_view EXTENSION = ".meta.json";

    static std::expected<std::unique_ptr<FileMetadataBackend>, std::error_code>
    open(std::string_view directory) noexcept;

    [[nodiscard]] std::expected<std::string, std::error_code>
    load(std::string_view key) noexcept override;

    [[nodiscard]] std::error_code
    save(std::string_view key, std::string_view document) noexcept override;

    [[nodiscard]] std::error_code remove(std::string_view key) noexcept override;
    [[nodiscard]] std::error_code remove_all() noexcept override;

    [[nodiscard]] std::string path_for(std::string_view key) const;

private:
    explicit FileMetadataBackend(std::string directory);

    std::string directory_;
};

class MemoryMetadataBackend final : public MetadataBackend {
public:
    [[nodiscard]] std::expected<std::string, std::error_code>
    load(std::string_view key) noexcept override;

    [[nodiscard]] std::error_code
    save(std::string_view key, std::string_view document) noexcept override;

    [[nodiscard]] std::error_code remove(std::string_view key) noexcept override;
    [[nodiscard]] std::error_code remove_all() noexcept override;

    // Overwrite a stored document directly (tests plant corrupt records)
    void put_raw(std::string_view key, std::string document);

    [[nodiscard]] std::size_t save_count() const noexcept;

private:
    std::map<std::string, std::string, std::less<>> documents_;
    std::size_t saves_{0};
    mutable std::mutex mutex_;
};

// Asynchronous, coalescing writer of PersistedRecords.
// Queued records are keyed by resource; a snapshot older than one already
// accepted for the same key is dropped. One background thread drains the queue.
class MetadataStore {
public:
    explicit MetadataStore(MetadataBackend& backend);
    ~MetadataStore();

    MetadataStore(const MetadataStore&) = delete;
    MetadataStore& operator=(const MetadataStore&) = delete;

    // Queued copy if any, otherwise the durable one; nullopt if none exists.
    // A document that fails validation is CacheErrc::cache_corruption.
    [[nodiscard]] std::expected<std::optional<PersistedRecord>, std::error_code>
    load(std::string_view key) noexcept;

    // Queue a snapshot for durable storage
    void persist(PersistedRecord record);

    // Block until everything queued so far is durable (or failed)
    void sync();

    // Drop queued snapshots for key, wait out an in-flight save, delete
    [[nodiscard]] std::error_code remove(std::string_view key) noexcept;
    [[nodiscard]] std::error_code remove_all() noexcept;

private:
    void run(std::stop_token stop);

    MetadataBackend& backend_;

    std::map<std::string, PersistedRecord, std::less<>> pending_;
    std::map<std::string, std::uint64_t, std::less<>> accepted_;  // Highest revision queued per key
    std::optional<std::string> in_flight_;
    std::mutex mutex_;
    std::condition_variable_any work_cv_;
    std::condition_variable_any idle_cv_;

    std::jthread writer_;  // Last member: joins before the rest is destroyed
};

} // namespace spool::core
