// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/chunk_store.hpp>
#include <spool/core/content_meta.hpp>
#include <spool/core/metadata_store.hpp>
#include <spool/core/range_index.hpp>
#include <cstdint>
#include <expected>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <system_error>

namespace spool::core {

// Everything cached for one resource. The record mutex serializes metadata
// and range bookkeeping; chunk I/O runs concurrently under the shared side
// of the I/O gate, which invalidate() takes exclusively.
class CacheRecord {
public:
    CacheRecord(std::string key, disk::ByteStore& bytes, MetadataStore& metadata);

    // Rebuild from a persisted record
    CacheRecord(PersistedRecord persisted, disk::ByteStore& bytes, MetadataStore& metadata);

    CacheRecord(const CacheRecord&) = delete;
    CacheRecord& operator=(const CacheRecord&) = delete;

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    // Write bytes, then mark them cached, then queue persistence.
    // CacheErrc::record_cleared once the record has been invalidated.
    [[nodiscard]] std::error_code store_chunk(std::uint64_t offset, std::span<const std::byte> data) noexcept;

    // Bytes for [offset, offset + length) if every one is cached.
    // A cleared record reports a miss.
    [[nodiscard]] std::expected<std::optional<Bytes>, std::error_code>
    read(std::uint64_t offset, std::uint64_t length) const noexcept;

    // Merge newer origin metadata and queue persistence
    [[nodiscard]] std::error_code update_metadata(const ContentMetadata& meta) noexcept;

    // nullopt until the origin has described the resource
    [[nodiscard]] std::optional<ContentMetadata> metadata() const;

    [[nodiscard]] bool contains(std::uint64_t offset, std::uint64_t length) const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> contiguous_end(std::uint64_t offset) const noexcept;
    [[nodiscard]] RangeIndex ranges() const;
    [[nodiscard]] std::uint64_t cached_bytes() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> content_length() const noexcept;

    // Derived on every call, never stored
    [[nodiscard]] bool is_fully_cached() const noexcept;
    [[nodiscard]] double percent_cached() const noexcept;

    [[nodiscard]] std::size_t chunk_count() const noexcept { return chunks_.chunk_count(); }

    // Waits for in-flight chunk I/O, then refuses all further writes
    void invalidate() noexcept;
    [[nodiscard]] bool invalidated() const noexcept;

    [[nodiscard]] PersistedRecord snapshot() const;

private:
    [[nodiscard]] bool is_fully_cached_locked() const noexcept;
    void persist() noexcept;

    std::string key_;
    MetadataStore& metadata_store_;

    mutable std::mutex mutex_;
    std::optional<ContentMetadata> metadata_;
    RangeIndex ranges_;
    std::uint64_t revision_{0};

    ChunkStore chunks_;

    mutable std::shared_mutex io_gate_;
    bool invalidated_{false};  // Written under the exclusive gate
};

} // namespace spool::core
