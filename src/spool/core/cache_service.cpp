// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/cache_service.hpp>
#include <spool/core/error.hpp>
#include <spool/core/format.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <mutex>

namespace spool::core {

CacheService::CacheService(disk::ByteStore& bytes, MetadataBackend& metadata)
    : bytes_(bytes)
    , metadata_(metadata) {}

//=============================================================================
// Record lookup
//=============================================================================

std::expected<std::shared_ptr<CacheRecord>, std::error_code>
CacheService::record(std::string_view key) noexcept {
    try {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = records_.find(key);
            if (it != records_.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = records_.find(key);
        if (it != records_.end()) {
            return it->second;
        }

        auto loaded = load_record(key);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        records_.emplace(std::string(key), *loaded);
        return *loaded;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(CacheErrc::storage_read_error));
    }
}

// Caller holds the exclusive lock
std::expected<std::shared_ptr<CacheRecord>, std::error_code>
CacheService::load_record(std::string_view key) {
    auto persisted = metadata_.load(key);
    if (persisted) {
        if (!*persisted) {
            return std::make_shared<CacheRecord>(std::string(key), bytes_, metadata_);
        }
        spdlog::debug("loaded cache record for {} ({} ranges)", key, (*persisted)->ranges.size());
        return std::make_shared<CacheRecord>(std::move(**persisted), bytes_, metadata_);
    }

    if (persisted.error() != CacheErrc::cache_corruption) {
        spdlog::error("failed to load cache record for {}: {}", key, persisted.error().message());
        return std::unexpected(make_error_code(CacheErrc::storage_read_error));
    }

    // Treat as a miss: drop whatever is stored and start over
    spdlog::warn("cache record for {} is corrupt, discarding it", key);
    if (auto ec = bytes_.remove(key)) {
        spdlog::warn("could not remove stale bytes for {}: {}", key, ec.message());
    }
    if (auto ec = metadata_.remove(key)) {
        spdlog::warn("could not remove stale metadata for {}: {}", key, ec.message());
    }
    return std::make_shared<CacheRecord>(std::string(key), bytes_, metadata_);
}

//=============================================================================
// Reads
//=============================================================================

std::expected<ProbeResult, std::error_code>
CacheService::probe(std::string_view key, std::uint64_t offset, std::uint64_t length) noexcept {
    if (length == 0) {
        return std::unexpected(make_error_code(CacheErrc::invalid_range));
    }

    auto rec = record(key);
    if (!rec) {
        return std::unexpected(rec.error());
    }

    try {
        if ((*rec)->contains(offset, length)) {
            auto bytes = (*rec)->read(offset, length);
            if (!bytes) {
                return std::unexpected(bytes.error());
            }
            if (*bytes) {
                spdlog::debug("cache hit for {} [{}, {})", key, offset, offset + length);
                return ProbeResult::full(std::move(**bytes));
            }
        }

        auto end = (*rec)->contiguous_end(offset);
        if (end && *end > offset) {
            const std::uint64_t prefix = std::min(*end, offset + length) - offset;
            auto bytes = (*rec)->read(offset, prefix);
            if (!bytes) {
                return std::unexpected(bytes.error());
            }
            if (*bytes) {
                spdlog::debug("partial cache hit for {}: {} of {} cached",
                              key, format_bytes(prefix), format_bytes(length));
                return ProbeResult::partial(std::move(**bytes), offset + prefix);
            }
        }

        spdlog::debug("cache miss for {} [{}, {})", key, offset, offset + length);
        return ProbeResult::miss();
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(CacheErrc::storage_read_error));
    }
}

std::expected<std::optional<Bytes>, std::error_code>
CacheService::read_range(std::string_view key, std::uint64_t offset, std::uint64_t length) noexcept {
    auto rec = record(key);
    if (!rec) {
        return std::unexpected(rec.error());
    }
    return (*rec)->read(offset, length);
}

std::optional<ContentMetadata> CacheService::content_metadata(std::string_view key) noexcept {
    auto rec = record(key);
    if (!rec) {
        return std::nullopt;
    }
    try {
        return (*rec)->metadata();
    } catch (const std::bad_alloc&) {
        return std::nullopt;
    }
}

bool CacheService::is_fully_cached(std::string_view key) noexcept {
    auto rec = record(key);
    return rec && (*rec)->is_fully_cached();
}

double CacheService::percent_cached(std::string_view key) noexcept {
    auto rec = record(key);
    return rec ? (*rec)->percent_cached() : 0.0;
}

bool CacheService::is_range_cached(std::string_view key, std::uint64_t offset, std::uint64_t length) noexcept {
    auto rec = record(key);
    if (!rec) {
        return false;
    }

    if ((*rec)->is_fully_cached()) {
        auto total = (*rec)->content_length();
        if (total && offset + length <= *total) {
            return true;
        }
    }
    return (*rec)->contains(offset, length);
}

std::optional<std::uint64_t> CacheService::contiguous_end(std::string_view key, std::uint64_t offset) noexcept {
    auto rec = record(key);
    if (!rec) {
        return std::nullopt;
    }
    return (*rec)->contiguous_end(offset);
}

std::vector<CachedRange> CacheService::cached_ranges(std::string_view key) noexcept {
    auto rec = record(key);
    if (!rec) {
        return {};
    }
    try {
        return (*rec)->ranges().ranges();
    } catch (const std::bad_alloc&) {
        return {};
    }
}

std::uint64_t CacheService::cached_bytes(std::string_view key) noexcept {
    auto rec = record(key);
    return rec ? (*rec)->cached_bytes() : 0;
}

std::string CacheService::describe_ranges(std::string_view key) noexcept {
    try {
        auto rec = record(key);
        if (!rec) {
            return "unavailable: " + rec.error().message();
        }
        return (*rec)->ranges().describe();
    } catch (const std::bad_alloc&) {
        return {};
    }
}

std::uint64_t CacheService::cache_size() const noexcept {
    return bytes_.size_on_disk();
}

//=============================================================================
// Writes
//=============================================================================

std::error_code CacheService::store_chunk(std::string_view key, std::uint64_t offset,
                                          std::span<const std::byte> data) noexcept {
    auto rec = record(key);
    if (!rec) {
        return rec.error();
    }
    return (*rec)->store_chunk(offset, data);
}

std::error_code CacheService::update_content_metadata(std::string_view key, const ContentMetadata& meta) noexcept {
    auto rec = record(key);
    if (!rec) {
        return rec.error();
    }
    return (*rec)->update_metadata(meta);
}

std::error_code CacheService::clear(std::string_view key) noexcept {
    try {
        // Held throughout: no fresh record for key can appear until the
        // old one is invalidated and its storage is gone
        std::unique_lock<std::shared_mutex> lock(mutex_);

        auto it = records_.find(key);
        if (it != records_.end()) {
            it->second->invalidate();
            records_.erase(it);
        }

        auto meta_ec = metadata_.remove(key);
        auto bytes_ec = bytes_.remove(key);
        if (meta_ec || bytes_ec) {
            spdlog::error("failed to clear {}: {}", key, (meta_ec ? meta_ec : bytes_ec).message());
            return make_error_code(CacheErrc::storage_write_error);
        }

        spdlog::info("cleared cache for {}", key);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("failed to clear {}: {}", key, e.what());
        return make_error_code(CacheErrc::storage_write_error);
    }
}

std::error_code CacheService::clear_all() noexcept {
    try {
        std::unique_lock<std::shared_mutex> lock(mutex_);

        for (auto& [key, rec] : records_) {
            rec->invalidate();
        }
        records_.clear();

        auto meta_ec = metadata_.remove_all();
        auto bytes_ec = bytes_.remove_all();
        if (meta_ec || bytes_ec) {
            spdlog::error("failed to clear cache: {}", (meta_ec ? meta_ec : bytes_ec).message());
            return make_error_code(CacheErrc::storage_write_error);
        }

        spdlog::info("cleared entire cache");
        return {};
    } catch (const std::exception& e) {
        spdlog::error("failed to clear cache: {}", e.what());
        return make_error_code(CacheErrc::storage_write_error);
    }
}

void CacheService::sync() {
    metadata_.sync();
}

} // namespace spool::core
