// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/cache_engine.hpp>
#include <spool/core/format.hpp>
#include <spool/core/http_session.hpp>
#include <spool/core/url.hpp>
#include <spdlog/spdlog.h>

namespace spool::core {

namespace {

// Captures the response head of a tiny ranged request and drops the body
class InfoProbe final : public FetchHandlers {
public:
    [[nodiscard]] std::error_code on_response(const OriginResponse& response) override {
        if (response.status != 200 && response.status != 206) {
            return make_error_code(CacheErrc::network_error);
        }
        response_ = response;
        return {};
    }

    // A server ignoring the range would send the whole body
    [[nodiscard]] bool on_data(std::span<const std::byte>) override { return false; }

    [[nodiscard]] bool should_stop() const override { return false; }

    [[nodiscard]] const std::optional<OriginResponse>& response() const noexcept { return response_; }

private:
    std::optional<OriginResponse> response_;
};

} // namespace

//=============================================================================
// Construction
//=============================================================================

std::expected<std::unique_ptr<CacheEngine>, std::error_code>
CacheEngine::create(CacheConfig config) noexcept {
    auto bytes = disk::FileByteStore::open(config.cache_dir, config.sync_writes);
    if (!bytes) {
        spdlog::error("cannot open cache directory {}: {}", config.cache_dir, bytes.error().message());
        return std::unexpected(bytes.error());
    }
    auto metadata = FileMetadataBackend::open(config.cache_dir);
    if (!metadata) {
        spdlog::error("cannot open cache directory {}: {}", config.cache_dir, metadata.error().message());
        return std::unexpected(metadata.error());
    }

    try {
        auto origin = std::make_unique<HttpSession>(config.user_agent);
        return std::unique_ptr<CacheEngine>(new CacheEngine(
            std::move(config), std::move(*bytes), std::move(*metadata), std::move(origin)));
    } catch (const std::exception& e) {
        spdlog::error("cannot create cache engine: {}", e.what());
        return std::unexpected(make_error_code(CacheErrc::storage_read_error));
    }
}

CacheEngine::CacheEngine(CacheConfig config, disk::ByteStore& bytes, MetadataBackend& metadata, OriginClient& origin)
    : config_(std::move(config))
    , origin_(origin)
    , cache_(bytes, metadata) {}

CacheEngine::CacheEngine(CacheConfig config, std::unique_ptr<disk::ByteStore> bytes,
                         std::unique_ptr<MetadataBackend> metadata, std::unique_ptr<OriginClient> origin)
    : config_(std::move(config))
    , owned_bytes_(std::move(bytes))
    , owned_metadata_(std::move(metadata))
    , owned_origin_(std::move(origin))
    , origin_(*owned_origin_)
    , cache_(*owned_bytes_, *owned_metadata_) {}

CacheEngine::~CacheEngine() {
    registry_.cancel_all();
    try {
        cache_.sync();
    } catch (const std::exception& e) {
        spdlog::warn("metadata may not be saved: {}", e.what());
    }
}

void CacheEngine::global_init() noexcept {
    HttpSession::global_init();
}

void CacheEngine::global_cleanup() noexcept {
    HttpSession::global_cleanup();
}

//=============================================================================
// Requests
//=============================================================================

std::expected<ProbeResult, std::error_code>
CacheEngine::probe(std::string_view url, std::uint64_t offset, std::uint64_t length) noexcept {
    auto key = cache_key_for(url);
    if (!key) {
        return std::unexpected(key.error());
    }
    return cache_.probe(*key, offset, length);
}

std::expected<RequestHandle, std::error_code>
CacheEngine::begin_fetch(std::string_view url, ByteRange range,
                         BytesCallback on_bytes, CompletionCallback on_complete) noexcept {
    auto handle = registry_.next_handle();
    if (auto ec = begin_fetch(handle, url, range, std::move(on_bytes), std::move(on_complete))) {
        return std::unexpected(ec);
    }
    return handle;
}

std::error_code CacheEngine::begin_fetch(RequestHandle handle, std::string_view url, ByteRange range,
                                         BytesCallback on_bytes, CompletionCallback on_complete) noexcept {
    auto key = cache_key_for(url);
    if (!key) {
        return key.error();
    }

    try {
        auto coordinator = std::make_unique<FetchCoordinator>(
            std::string(url), std::move(*key), range, cache_, origin_, config_,
            std::move(on_bytes), std::move(on_complete));

        if (auto ec = registry_.add(handle, std::move(coordinator))) {
            spdlog::debug("request {} for {} rejected: {}", handle, url, ec.message());
            return ec;
        }
        spdlog::debug("request {} started for {} at offset {}", handle, url, range.offset);
        return {};
    } catch (const std::exception& e) {
        spdlog::error("cannot start request for {}: {}", url, e.what());
        return make_error_code(CacheErrc::network_error);
    }
}

bool CacheEngine::cancel(RequestHandle handle) noexcept {
    return registry_.cancel(handle);
}

//=============================================================================
// Cache state
//=============================================================================

std::expected<CacheStatus, std::error_code> CacheEngine::status(std::string_view url) noexcept {
    auto key = cache_key_for(url);
    if (!key) {
        return std::unexpected(key.error());
    }
    auto rec = cache_.record(*key);
    if (!rec) {
        return std::unexpected(rec.error());
    }

    CacheStatus s;
    s.is_fully_cached = (*rec)->is_fully_cached();
    s.percent_cached = (*rec)->percent_cached();
    s.cached_bytes = (*rec)->cached_bytes();
    s.content_length = (*rec)->content_length();
    return s;
}

std::expected<ContentMetadata, std::error_code> CacheEngine::content_info(std::string_view url) noexcept {
    auto key = cache_key_for(url);
    if (!key) {
        return std::unexpected(key.error());
    }

    if (auto cached = cache_.content_metadata(*key); cached && cached->content_length) {
        return *cached;
    }

    InfoProbe info;
    auto ec = origin_.fetch(url, 0, 1, info);
    const auto& response = info.response();
    if (!response) {
        spdlog::warn("content info for {} failed: {}", url, ec.message());
        return std::unexpected(ec ? ec : make_error_code(CacheErrc::network_error));
    }

    ContentMetadata meta;
    meta.content_length = response->total_length;
    meta.content_type = response->content_type;
    meta.supports_range_access = response->status == 206 || response->accepts_ranges;
    meta.last_modified = now_timestamp();

    if (auto store_ec = cache_.update_content_metadata(*key, meta)) {
        spdlog::warn("could not record content info for {}: {}", url, store_ec.message());
        return meta;
    }
    if (meta.content_length) {
        spdlog::debug("{} is {}", url, format_bytes(*meta.content_length));
    }

    if (auto merged = cache_.content_metadata(*key)) {
        return *merged;
    }
    return meta;
}

std::error_code CacheEngine::clear(std::string_view url) noexcept {
    auto key = cache_key_for(url);
    if (!key) {
        return key.error();
    }
    return cache_.clear(*key);
}

std::error_code CacheEngine::clear_all() noexcept {
    return cache_.clear_all();
}

std::expected<std::string, std::error_code> CacheEngine::describe_ranges(std::string_view url) noexcept {
    auto key = cache_key_for(url);
    if (!key) {
        return std::unexpected(key.error());
    }
    return cache_.describe_ranges(*key);
}

} // namespace spool::core
