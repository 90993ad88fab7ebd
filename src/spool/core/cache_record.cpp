// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/cache_record.hpp>
#include <spool/core/error.hpp>
#include <spool/core/format.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace spool::core {

CacheRecord::CacheRecord(std::string key, disk::ByteStore& bytes, MetadataStore& metadata)
    : key_(std::move(key))
    , metadata_store_(metadata)
    , chunks_(bytes, key_) {}

CacheRecord::CacheRecord(PersistedRecord persisted, disk::ByteStore& bytes, MetadataStore& metadata)
    : key_(std::move(persisted.key))
    , metadata_store_(metadata)
    , ranges_(std::move(persisted.ranges))
    , revision_(persisted.revision)
    , chunks_(bytes, key_, std::move(persisted.chunks)) {
    // A record that never saw an origin response carries no timestamp
    if (persisted.metadata.last_modified != Timestamp{}) {
        metadata_ = std::move(persisted.metadata);
    }
}

//=============================================================================
// Mutation
//=============================================================================

std::error_code CacheRecord::store_chunk(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    if (data.empty()) {
        return {};
    }

    std::shared_lock<std::shared_mutex> gate(io_gate_);
    if (invalidated_) {
        return make_error_code(CacheErrc::record_cleared);
    }

    auto ec = chunks_.write_chunk(offset, data);
    if (ec) {
        spdlog::error("failed to write {} at offset {} for {}: {}",
                      format_bytes(data.size()), offset, key_, ec.message());
        return make_error_code(CacheErrc::storage_write_error);
    }

    bool became_full = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool was_full = is_fully_cached_locked();
        try {
            ranges_.insert(offset, data.size());
        } catch (const std::bad_alloc&) {
            return make_error_code(CacheErrc::storage_write_error);
        }
        ++revision_;
        became_full = !was_full && is_fully_cached_locked();
    }

    spdlog::debug("cached {} at offset {} for {}", format_bytes(data.size()), offset, key_);
    if (became_full) {
        spdlog::info("{} is now fully cached", key_);
    }

    persist();
    return {};
}

std::error_code CacheRecord::update_metadata(const ContentMetadata& meta) noexcept {
    std::shared_lock<std::shared_mutex> gate(io_gate_);
    if (invalidated_) {
        return make_error_code(CacheErrc::record_cleared);
    }

    try {
        std::lock_guard<std::mutex> lock(mutex_);
        ContentMetadata stamped = meta;
        if (stamped.last_modified == Timestamp{}) {
            stamped.last_modified = now_timestamp();
        }
        if (metadata_) {
            metadata_->merge(stamped);
        } else {
            metadata_ = std::move(stamped);
        }
        ++revision_;
    } catch (const std::bad_alloc&) {
        return make_error_code(CacheErrc::storage_write_error);
    }

    persist();
    return {};
}

void CacheRecord::invalidate() noexcept {
    std::unique_lock<std::shared_mutex> gate(io_gate_);
    invalidated_ = true;

    std::lock_guard<std::mutex> lock(mutex_);
    metadata_.reset();
    ranges_.clear();
    chunks_.reset();
}

bool CacheRecord::invalidated() const noexcept {
    std::shared_lock<std::shared_mutex> gate(io_gate_);
    return invalidated_;
}

// Caller holds the shared gate, so a concurrent clear cannot slip in
// between the check and the queued snapshot
void CacheRecord::persist() noexcept {
    try {
        metadata_store_.persist(snapshot());
    } catch (const std::exception& e) {
        spdlog::warn("could not queue metadata for {}: {}", key_, e.what());
    }
}

//=============================================================================
// Queries
//=============================================================================

std::expected<std::optional<Bytes>, std::error_code>
CacheRecord::read(std::uint64_t offset, std::uint64_t length) const noexcept {
    std::shared_lock<std::shared_mutex> gate(io_gate_);
    if (invalidated_) {
        return std::optional<Bytes>{};
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ranges_.contains(offset, length)) {
            return std::optional<Bytes>{};
        }
    }

    auto bytes = chunks_.read_range(offset, length);
    if (bytes && !bytes->has_value()) {
        // The index said cached but the chunks disagree
        spdlog::warn("range [{}, {}) of {} is indexed but not backed by chunks",
                     offset, offset + length, key_);
    }
    return bytes;
}

std::optional<ContentMetadata> CacheRecord::metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
}

bool CacheRecord::contains(std::uint64_t offset, std::uint64_t length) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return ranges_.contains(offset, length);
}

std::optional<std::uint64_t> CacheRecord::contiguous_end(std::uint64_t offset) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return ranges_.contiguous_end(offset);
}

RangeIndex CacheRecord::ranges() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ranges_;
}

std::uint64_t CacheRecord::cached_bytes() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return ranges_.cached_bytes();
}

std::optional<std::uint64_t> CacheRecord::content_length() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!metadata_) return std::nullopt;
    return metadata_->content_length;
}

bool CacheRecord::is_fully_cached() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return is_fully_cached_locked();
}

bool CacheRecord::is_fully_cached_locked() const noexcept {
    if (!metadata_ || !metadata_->content_length) {
        return false;
    }
    return ranges_.cached_bytes() == *metadata_->content_length;
}

double CacheRecord::percent_cached() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!metadata_ || !metadata_->content_length) {
        return 0.0;
    }

    const auto total = *metadata_->content_length;
    if (total == 0) {
        return 100.0;
    }
    const double pct = 100.0 * static_cast<double>(ranges_.cached_bytes()) / static_cast<double>(total);
    return std::min(100.0, pct);
}

PersistedRecord CacheRecord::snapshot() const {
    PersistedRecord rec;
    rec.key = key_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        rec.revision = revision_;
        if (metadata_) {
            rec.metadata = *metadata_;
        }
        rec.ranges = ranges_.ranges();
    }
    // Taken after the ranges: chunks only grow, so every range stays backed
    rec.chunks = chunks_.chunks();
    return rec;
}

} // namespace spool::core
