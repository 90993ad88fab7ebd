// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/fetch_coordinator.hpp>
#include <spool/core/format.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace spool::core {

namespace {

// Largest piece handed to the caller from the cache at once
constexpr std::uint64_t SERVE_PIECE_SIZE = 1024 * 1024;

} // namespace

const char* to_string(FetchState state) noexcept {
    switch (state) {
        case FetchState::created:               return "created";
        case FetchState::cache_probe:           return "cache_probe";
        case FetchState::served_from_cache:     return "served_from_cache";
        case FetchState::partial_then_fetching: return "partial_then_fetching";
        case FetchState::fetching:              return "fetching";
        case FetchState::completed:             return "completed";
        case FetchState::cancelled:             return "cancelled";
        case FetchState::failed:                return "failed";
        default:                                return "unknown";
    }
}

//=============================================================================
// FetchCoordinator
//=============================================================================

FetchCoordinator::FetchCoordinator(std::string url, std::string key, ByteRange range,
                                   CacheService& cache, OriginClient& origin, const CacheConfig& config,
                                   BytesCallback on_bytes, CompletionCallback on_complete)
    : url_(std::move(url))
    , key_(std::move(key))
    , offset_(range.offset)
    , cache_(cache)
    , origin_(origin)
    , config_(config)
    , on_bytes_(std::move(on_bytes))
    , on_complete_(std::move(on_complete)) {
    if (range.length) {
        end_ = range.offset + *range.length;
    }
    delivered_.store(offset_, std::memory_order_relaxed);
}

FetchCoordinator::~FetchCoordinator() {
    cancel();
    if (on_worker_thread()) {
        // A thread cannot join itself
        worker_.detach();
    }
}

std::error_code FetchCoordinator::start() noexcept {
    if (end_ && (*end_ <= offset_)) {
        // Zero length, or offset + length wrapped around. Rejected
        // synchronously, so no completion callback.
        auto ec = make_error_code(CacheErrc::invalid_range);
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_ = ec;
        }
        state(FetchState::failed);
        mark_done();
        return ec;
    }
    if (cancel_requested_.load(std::memory_order_acquire)) {
        return make_error_code(CacheErrc::cancelled);
    }

    auto expected = FetchState::created;
    if (!state_.compare_exchange_strong(expected, FetchState::cache_probe,
                                        std::memory_order_acq_rel)) {
        return make_error_code(CacheErrc::invalid_range);
    }

    try {
        worker_ = std::jthread([this] { run(); });
    } catch (const std::system_error& e) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            error_ = e.code();
        }
        state(FetchState::failed);
        mark_done();
        return e.code();
    }
    return {};
}

void FetchCoordinator::cancel() noexcept {
    if (cancel_requested_.exchange(true, std::memory_order_acq_rel)) {
        return;  // Already cancelled
    }

    if (on_worker_thread()) {
        // Called from inside a callback: the worker saves on its way out
        stop_.store(true, std::memory_order_release);
        return;
    }

    {
        // No data callback can run between the save and the stop flag
        std::lock_guard<std::mutex> lock(io_mutex_);
        if (auto ec = flush_locked()) {
            spdlog::warn("could not save received bytes of {} before cancel: {}", url_, ec.message());
        }
        stop_.store(true, std::memory_order_release);
    }

    if (worker_.joinable()) {
        worker_.join();
    }

    if (!finished()) {
        // Never started
        finish(FetchState::cancelled, make_error_code(CacheErrc::cancelled));
        mark_done();
    }
}

void FetchCoordinator::wait() noexcept {
    if (state() == FetchState::created) return;

    std::unique_lock<std::mutex> lock(done_mutex_);
    done_cv_.wait(lock, [this] { return done_; });
}

bool FetchCoordinator::finished() const noexcept {
    auto s = state();
    return s == FetchState::completed || s == FetchState::cancelled || s == FetchState::failed;
}

std::error_code FetchCoordinator::error() const noexcept {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

bool FetchCoordinator::on_worker_thread() const noexcept {
    return worker_id_.load(std::memory_order_acquire) == std::this_thread::get_id();
}

//=============================================================================
// Worker
//=============================================================================

void FetchCoordinator::run() noexcept {
    worker_id_.store(std::this_thread::get_id(), std::memory_order_release);
    try {
        auto rec = cache_.record(key_);
        if (!rec) {
            finish(FetchState::failed, rec.error());
            mark_done();
            return;
        }
        {
            std::lock_guard<std::mutex> lock(io_mutex_);
            record_ = *rec;
        }

        if (auto total = record_->content_length()) {
            if (offset_ >= *total) {
                if (offset_ == *total && !end_) {
                    finish(FetchState::completed, {});  // Nothing after the last byte
                } else {
                    finish(FetchState::failed, make_error_code(CacheErrc::invalid_range));
                }
                mark_done();
                return;
            }
            end_ = end_ ? std::min(*end_, *total) : *total;
        }

        if (end_) {
            auto probe = cache_.probe(key_, offset_, *end_ - offset_);
            if (!probe) {
                spdlog::warn("cache lookup for {} failed, fetching from origin: {}", url_, probe.error().message());
            } else if (probe->is_full()) {
                state(FetchState::served_from_cache);
                deliver(offset_, probe->bytes);
                finish(FetchState::completed, {});
                mark_done();
                return;
            } else if (probe->is_partial()) {
                deliver(offset_, probe->bytes);
                state(FetchState::partial_then_fetching);
            }
        } else if (serve_cached_prefix()) {
            state(FetchState::partial_then_fetching);
        }

        if (state() == FetchState::cache_probe) {
            state(FetchState::fetching);
        }

        auto outcome = settle(fetch_remaining());
        finish(outcome.state, outcome.ec);
    } catch (const std::exception& e) {
        spdlog::error("fetch of {} aborted: {}", url_, e.what());
        finish(FetchState::failed, make_error_code(CacheErrc::network_error));
    }
    mark_done();
}

bool FetchCoordinator::serve_cached_prefix() {
    bool served = false;
    while (!stop_.load(std::memory_order_acquire)) {
        const std::uint64_t cursor = delivered_.load(std::memory_order_relaxed);
        if (end_ && cursor >= *end_) break;

        auto cached_end = record_->contiguous_end(cursor);
        if (!cached_end) break;

        std::uint64_t stop_at = end_ ? std::min(*cached_end, *end_) : *cached_end;
        stop_at = std::min(stop_at, cursor + SERVE_PIECE_SIZE);

        auto bytes = record_->read(cursor, stop_at - cursor);
        if (!bytes) {
            spdlog::warn("cache read for {} failed: {}", url_, bytes.error().message());
            break;
        }
        if (!*bytes) break;

        deliver(cursor, **bytes);
        served = true;
    }
    return served;
}

void FetchCoordinator::deliver(std::uint64_t offset, std::span<const std::byte> data) {
    if (data.empty()) return;
    if (on_bytes_) {
        on_bytes_(offset, data);
    }
    delivered_.store(offset + data.size(), std::memory_order_relaxed);
}

std::error_code FetchCoordinator::fetch_remaining() {
    // Another request may have cached more since the probe
    (void)serve_cached_prefix();

    if (stop_.load(std::memory_order_acquire)) {
        return make_error_code(CacheErrc::cancelled);
    }

    const std::uint64_t start = delivered_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(io_mutex_);
        request_start_ = start;
        body_pos_ = start;
        saved_offset_ = start;
        saved_atomic_.store(start, std::memory_order_relaxed);
    }

    if (end_ && start >= *end_) {
        return {};
    }

    std::optional<std::uint64_t> last;
    if (end_) {
        last = *end_ - 1;
    }

    spdlog::debug("fetching {} from offset {}{}", url_, start,
                  end_ ? " to " + std::to_string(*end_) : std::string(" to end"));
    return origin_.fetch(url_, start, last, *this);
}

FetchCoordinator::Outcome FetchCoordinator::settle(std::error_code fetch_ec) {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (stop_.load(std::memory_order_acquire)) {
        if (auto ec = flush_locked()) {
            spdlog::warn("could not save received bytes of {} on cancel: {}", url_, ec.message());
        }
        return {FetchState::cancelled, make_error_code(CacheErrc::cancelled)};
    }

    if (storage_error_) {
        // Bookkeeping stays at the last successful write
        pending_.clear();
        return {FetchState::failed, make_error_code(CacheErrc::storage_write_error)};
    }

    if (reached_end_) {
        fetch_ec.clear();  // We stopped the transfer ourselves
    }

    if (overflow_) {
        if (auto ec = flush_locked()) {
            spdlog::warn("could not save received bytes of {}: {}", url_, ec.message());
        }
        spdlog::error("{} sent more bytes than announced", url_);
        return {FetchState::failed, make_error_code(CacheErrc::network_error)};
    }

    if (fetch_ec) {
        // Keep whatever arrived before the failure
        if (auto ec = flush_locked()) {
            spdlog::warn("could not save received bytes of {}: {}", url_, ec.message());
        }
        return {FetchState::failed, fetch_ec};
    }

    if (!reached_end_ && expected_end_ && body_pos_ != *expected_end_) {
        if (auto ec = flush_locked()) {
            spdlog::warn("could not save received bytes of {}: {}", url_, ec.message());
        }
        spdlog::error("{} ended after {} of {} expected bytes", url_,
                      body_pos_ - request_start_, *expected_end_ - request_start_);
        return {FetchState::failed, make_error_code(CacheErrc::network_error)};
    }

    if (!reached_end_ && end_ && body_pos_ < *end_) {
        // The origin answered a shorter range than was asked for
        if (auto ec = flush_locked()) {
            spdlog::warn("could not save received bytes of {}: {}", url_, ec.message());
        }
        spdlog::error("{} answered {} of {} requested bytes", url_,
                      body_pos_ - request_start_, *end_ - request_start_);
        return {FetchState::failed, make_error_code(CacheErrc::network_error)};
    }

    if (auto ec = flush_locked()) {
        return {FetchState::failed, make_error_code(CacheErrc::storage_write_error)};
    }

    // A whole-resource body of unannounced size ends at the resource end.
    // A "bytes a-b/*" reply says nothing about what follows b.
    if (!end_ && record_ && response_status_ == 200 && body_pos_ > request_start_) {
        ContentMetadata meta = record_->metadata().value_or(ContentMetadata{});
        meta.content_length = body_pos_;
        meta.last_modified = now_timestamp();
        if (auto ec = record_->update_metadata(meta); ec && ec != CacheErrc::record_cleared) {
            spdlog::warn("could not record length of {}: {}", url_, ec.message());
        }
    }

    return {FetchState::completed, {}};
}

//=============================================================================
// Origin callbacks
//=============================================================================

std::error_code FetchCoordinator::on_response(const OriginResponse& response) {
    if (stop_.load(std::memory_order_acquire)) {
        return make_error_code(CacheErrc::cancelled);
    }

    std::lock_guard<std::mutex> lock(io_mutex_);

    if (response.status != 200 && response.status != 206) {
        spdlog::error("unexpected HTTP {} for {}", response.status, url_);
        return make_error_code(CacheErrc::network_error);
    }
    if (response.status == 206 && response.range_start != request_start_) {
        spdlog::error("{} answered offset {} for a request at {}", url_, response.range_start, request_start_);
        return make_error_code(CacheErrc::range_mismatch);
    }

    // Checked before anything from this response is written
    auto known = record_->content_length();
    if (response.total_length && known && *response.total_length != *known) {
        spdlog::error("{} reports {} bytes but the cache recorded {}", url_,
                      *response.total_length, *known);
        return make_error_code(CacheErrc::range_mismatch);
    }

    ContentMetadata meta;
    meta.content_length = response.total_length;
    meta.content_type = response.content_type;
    meta.last_modified = now_timestamp();

    if (response.status == 206) {
        meta.supports_range_access = true;
        body_pos_ = response.range_start;
        if (response.body_length) {
            expected_end_ = response.range_start + *response.body_length;
        }
    } else {
        // The whole resource; drop what precedes the requested start
        meta.supports_range_access = request_start_ == 0 && response.accepts_ranges;
        body_pos_ = 0;
        if (response.total_length) {
            expected_end_ = *response.total_length;
        }
        if (request_start_ > 0) {
            spdlog::warn("{} ignored the byte range, discarding {} leading bytes",
                         url_, format_bytes(request_start_));
        }
    }

    if (auto ec = record_->update_metadata(meta); ec && ec != CacheErrc::record_cleared) {
        spdlog::warn("could not record metadata of {}: {}", url_, ec.message());
    }

    response_status_ = response.status;
    if (response.total_length) {
        end_ = end_ ? std::min(*end_, *response.total_length) : *response.total_length;
    }
    return {};
}

bool FetchCoordinator::on_data(std::span<const std::byte> data) {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (stop_.load(std::memory_order_acquire) || storage_error_) {
        return false;
    }

    // Leading bytes of a 200 reply to a ranged request
    if (body_pos_ < request_start_) {
        auto drop = std::min<std::uint64_t>(data.size(), request_start_ - body_pos_);
        data = data.subspan(drop);
        body_pos_ += drop;
        if (data.empty()) return true;
    }

    bool truncated = false;
    if (end_ && body_pos_ + data.size() > *end_) {
        data = data.first(*end_ > body_pos_ ? *end_ - body_pos_ : 0);
        reached_end_ = true;
        truncated = true;
    } else if (expected_end_ && body_pos_ + data.size() > *expected_end_) {
        data = data.first(*expected_end_ > body_pos_ ? *expected_end_ - body_pos_ : 0);
        overflow_ = true;
        truncated = true;
    }

    if (!data.empty()) {
        deliver(body_pos_, data);
        pending_.insert(pending_.end(), data.begin(), data.end());
        body_pos_ += data.size();

        if (config_.incremental_caching &&
            pending_.size() >= config_.effective_checkpoint_threshold()) {
            if (flush_locked()) {
                return false;
            }
        }
    }

    if (end_ && body_pos_ == *end_ && expected_end_ && *expected_end_ > *end_) {
        // Got everything asked for from a longer body
        reached_end_ = true;
        return false;
    }
    return !truncated;
}

bool FetchCoordinator::should_stop() const {
    return stop_.load(std::memory_order_acquire);
}

std::error_code FetchCoordinator::flush_locked() noexcept {
    if (pending_.empty() || !record_) {
        return {};
    }

    const std::uint64_t size = pending_.size();
    auto ec = record_->store_chunk(saved_offset_, pending_);
    if (ec == CacheErrc::record_cleared) {
        // Keep streaming to the caller, just stop caching
        spdlog::debug("cache for {} was cleared, dropping {}", url_, format_bytes(size));
        saved_offset_ += size;
        pending_.clear();
        return {};
    }
    if (ec) {
        storage_error_ = ec;
        return ec;
    }

    saved_offset_ += size;
    saved_atomic_.store(saved_offset_, std::memory_order_relaxed);
    pending_.clear();
    flush_count_.fetch_add(1, std::memory_order_relaxed);
    spdlog::debug("checkpoint of {}: saved through offset {}", url_, saved_offset_);
    return {};
}

void FetchCoordinator::finish(FetchState final_state, std::error_code ec) noexcept {
    {
        std::lock_guard<std::mutex> lock(error_mutex_);
        error_ = ec;
    }
    state(final_state);

    switch (final_state) {
        case FetchState::completed:
            spdlog::debug("fetch of {} complete ({} delivered)", url_,
                          format_bytes(delivered_offset() - offset_));
            break;
        case FetchState::failed:
            spdlog::error("fetch of {} failed: {}", url_, ec.message());
            break;
        default:
            spdlog::debug("fetch of {} cancelled", url_);
            return;  // No completion callback after cancel
    }

    try {
        if (on_complete_) {
            on_complete_(ec);
        }
        if (on_finished_) {
            on_finished_();
        }
    } catch (const std::exception& e) {
        spdlog::error("completion handler for {} threw: {}", url_, e.what());
    }
}

void FetchCoordinator::mark_done() noexcept {
    {
        std::lock_guard<std::mutex> lock(done_mutex_);
        done_ = true;
    }
    done_cv_.notify_all();
}

} // namespace spool::core
