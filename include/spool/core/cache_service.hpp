// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/cache_record.hpp>
#include <spool/core/content_meta.hpp>
#include <spool/core/metadata_store.hpp>
#include <spool/core/range_index.hpp>
#include <spool/disk/byte_store.hpp>
#include <cstdint>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace spool::core {

// Outcome of a cache lookup for a byte span
struct ProbeResult {
    enum class Kind : std::uint8_t { full, partial, miss };

    Kind kind{Kind::miss};
    Bytes bytes;                          // full: the whole span, partial: the cached prefix
    std::uint64_t remaining_offset{0};    // partial: first byte still to fetch

    [[nodiscard]] static ProbeResult full(Bytes bytes) {
        return {Kind::full, std::move(bytes), 0};
    }
    [[nodiscard]] static ProbeResult partial(Bytes bytes, std::uint64_t remaining_offset) {
        return {Kind::partial, std::move(bytes), remaining_offset};
    }
    [[nodiscard]] static ProbeResult miss() {
        return {};
    }

    [[nodiscard]] bool is_full() const noexcept { return kind == Kind::full; }
    [[nodiscard]] bool is_partial() const noexcept { return kind == Kind::partial; }
    [[nodiscard]] bool is_miss() const noexcept { return kind == Kind::miss; }
};

// Cache-first facade over every resource's CacheRecord. Records are
// created lazily and loaded from the metadata store on first use.
class CacheService {
public:
    CacheService(disk::ByteStore& bytes, MetadataBackend& metadata);

    CacheService(const CacheService&) = delete;
    CacheService& operator=(const CacheService&) = delete;

    // Full hit, cached prefix, or miss for [offset, offset + length)
    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(std::string_view key, std::uint64_t offset, std::uint64_t length) noexcept;

    // The single write path: chunk bytes, then range index, then async persist
    [[nodiscard]] std::error_code
    store_chunk(std::string_view key, std::uint64_t offset, std::span<const std::byte> data) noexcept;

    // Bytes for a span only if all of it is cached
    [[nodiscard]] std::expected<std::optional<Bytes>, std::error_code>
    read_range(std::string_view key, std::uint64_t offset, std::uint64_t length) noexcept;

    [[nodiscard]] std::optional<ContentMetadata> content_metadata(std::string_view key) noexcept;

    // Field-merging put; known fields are never erased
    [[nodiscard]] std::error_code update_content_metadata(std::string_view key, const ContentMetadata& meta) noexcept;

    [[nodiscard]] bool is_fully_cached(std::string_view key) noexcept;
    [[nodiscard]] double percent_cached(std::string_view key) noexcept;
    [[nodiscard]] bool is_range_cached(std::string_view key, std::uint64_t offset, std::uint64_t length) noexcept;
    [[nodiscard]] std::optional<std::uint64_t> contiguous_end(std::string_view key, std::uint64_t offset) noexcept;
    [[nodiscard]] std::vector<CachedRange> cached_ranges(std::string_view key) noexcept;
    [[nodiscard]] std::uint64_t cached_bytes(std::string_view key) noexcept;
    [[nodiscard]] std::string describe_ranges(std::string_view key) noexcept;

    // Bytes the byte store occupies across every resource
    [[nodiscard]] std::uint64_t cache_size() const noexcept;

    // Remove metadata, ranges and bytes. Writers holding the old record
    // get CacheErrc::record_cleared from then on.
    [[nodiscard]] std::error_code clear(std::string_view key) noexcept;
    [[nodiscard]] std::error_code clear_all() noexcept;

    // Wait until queued metadata is durable
    void sync();

    // The live record for key, loading or creating it
    [[nodiscard]] std::expected<std::shared_ptr<CacheRecord>, std::error_code>
    record(std::string_view key) noexcept;

private:
    [[nodiscard]] std::expected<std::shared_ptr<CacheRecord>, std::error_code>
    load_record(std::string_view key);

    disk::ByteStore& bytes_;
    MetadataStore metadata_;

    std::map<std::string, std::shared_ptr<CacheRecord>, std::less<>> records_;
    mutable std::shared_mutex mutex_;  // Protects records_
};

} // namespace spool::core
