// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/cache_service.hpp>
#include <spool/core/config.hpp>
#include <spool/core/content_meta.hpp>
#include <spool/core/error.hpp>
#include <spool/core/fetch_coordinator.hpp>
#include <spool/core/metadata_store.hpp>
#include <spool/core/origin_client.hpp>
#include <spool/core/request_registry.hpp>
#include <spool/disk/byte_store.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace spool::core {

// Cache state of one resource
struct CacheStatus {
    bool is_fully_cached{false};
    double percent_cached{0.0};
    std::uint64_t cached_bytes{0};
    std::optional<std::uint64_t> content_length;
};

// Cache-first range fetching over an origin. Owns the cache service and
// the request registry; every resource is addressed by its URL.
class CacheEngine {
public:
    // Filesystem cache under config.cache_dir, libcurl origin
    static std::expected<std::unique_ptr<CacheEngine>, std::error_code>
    create(CacheConfig config) noexcept;

    // Caller-owned backends, which must outlive the engine
    CacheEngine(CacheConfig config, disk::ByteStore& bytes, MetadataBackend& metadata, OriginClient& origin);

    // Cancels every active request (each saves what it received), then
    // waits for queued metadata
    ~CacheEngine();

    CacheEngine(const CacheEngine&) = delete;
    CacheEngine& operator=(const CacheEngine&) = delete;

    [[nodiscard]] std::expected<ProbeResult, std::error_code>
    probe(std::string_view url, std::uint64_t offset, std::uint64_t length) noexcept;

    // Start a cache-first fetch under a fresh handle
    [[nodiscard]] std::expected<RequestHandle, std::error_code>
    begin_fetch(std::string_view url, ByteRange range, BytesCallback on_bytes, CompletionCallback on_complete) noexcept;

    // Start a fetch under a caller-chosen handle, replacing a live one
    [[nodiscard]] std::error_code
    begin_fetch(RequestHandle handle, std::string_view url, ByteRange range,
                BytesCallback on_bytes, CompletionCallback on_complete) noexcept;

    // False if no request is active under handle
    bool cancel(RequestHandle handle) noexcept;

    [[nodiscard]] bool is_active(RequestHandle handle) const noexcept { return registry_.contains(handle); }
    [[nodiscard]] std::size_t active_requests() const noexcept { return registry_.size(); }

    [[nodiscard]] std::expected<CacheStatus, std::error_code> status(std::string_view url) noexcept;

    // Content metadata from the cache, or learned with a two-byte origin
    // request and recorded
    [[nodiscard]] std::expected<ContentMetadata, std::error_code> content_info(std::string_view url) noexcept;

    [[nodiscard]] std::error_code clear(std::string_view url) noexcept;
    [[nodiscard]] std::error_code clear_all() noexcept;

    [[nodiscard]] std::expected<std::string, std::error_code> describe_ranges(std::string_view url) noexcept;
    [[nodiscard]] std::uint64_t cache_size() const noexcept { return cache_.cache_size(); }

    void sync() { cache_.sync(); }

    [[nodiscard]] const CacheConfig& config() const noexcept { return config_; }
    [[nodiscard]] CacheService& cache() noexcept { return cache_; }

    // libcurl global state (call once at startup / shutdown)
    static void global_init() noexcept;
    static void global_cleanup() noexcept;

private:
    CacheEngine(CacheConfig config, std::unique_ptr<disk::ByteStore> bytes,
                std::unique_ptr<MetadataBackend> metadata, std::unique_ptr<OriginClient> origin);

    CacheConfig config_;

    std::unique_ptr<disk::ByteStore> owned_bytes_;
    std::unique_ptr<MetadataBackend> owned_metadata_;
    std::unique_ptr<OriginClient> owned_origin_;

    OriginClient& origin_;
    CacheService cache_;
    RequestRegistry registry_;  // Torn down before cache_
};

} // namespace spool::core
