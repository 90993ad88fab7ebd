// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/cache_service.hpp>
#include <spool/core/config.hpp>
#include <spool/core/error.hpp>
#include <spool/core/origin_client.hpp>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <thread>

namespace spool::core {

// Fetch state machine
enum class FetchState : std::uint8_t {
    created,                // Not started
    cache_probe,            // Looking up the cache
    served_from_cache,      // Full hit, no network
    partial_then_fetching,  // Cached prefix delivered, fetching the rest
    fetching,               // Streaming from the origin
    completed,              // Finished successfully
    cancelled,              // Cancelled by the caller
    failed                  // Failed with error
};

[[nodiscard]] const char* to_string(FetchState state) noexcept;

// Requested span; no length means "to the end of the resource"
struct ByteRange {
    std::uint64_t offset{0};
    std::optional<std::uint64_t> length;

    [[nodiscard]] static ByteRange to_end(std::uint64_t offset) noexcept { return {offset, std::nullopt}; }
};

// Bytes for the caller, in order; offset is the resource offset of data[0]
using BytesCallback = std::function<void(std::uint64_t offset, std::span<const std::byte> data)>;

// Called once on completion or failure, never after cancel()
using CompletionCallback = std::function<void(std::error_code ec)>;

// One in-flight request: cache first, then the origin for whatever is
// missing. Received bytes are forwarded to the caller and checkpointed to
// the cache every effective_checkpoint_threshold() bytes.
class FetchCoordinator final : private FetchHandlers {
public:
    FetchCoordinator(std::string url, std::string key, ByteRange range,
                     CacheService& cache, OriginClient& origin, const CacheConfig& config,
                     BytesCallback on_bytes, CompletionCallback on_complete);

    // Cancels (saving what was received) and joins the worker
    ~FetchCoordinator() override;

    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    // Validate the range and start the worker thread
    [[nodiscard]] std::error_code start() noexcept;

    // Save unsaved bytes, then abort the transfer. Idempotent; safe from
    // any thread, including from inside the bytes callback.
    void cancel() noexcept;

    // Block until the worker has finished
    void wait() noexcept;

    // Invoked on the worker after completion or failure (not after cancel)
    void on_finished(std::function<void()> hook) { on_finished_ = std::move(hook); }

    [[nodiscard]] FetchState state() const noexcept { return state_.load(std::memory_order_acquire); }
    [[nodiscard]] bool finished() const noexcept;
    [[nodiscard]] std::error_code error() const noexcept;

    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::string& key() const noexcept { return key_; }

    // Resource offset up to which bytes were handed to the caller
    [[nodiscard]] std::uint64_t delivered_offset() const noexcept { return delivered_.load(std::memory_order_relaxed); }

    // Resource offset up to which received bytes are durably cached
    [[nodiscard]] std::uint64_t saved_offset() const noexcept { return saved_atomic_.load(std::memory_order_relaxed); }

    // Checkpoints that actually wrote bytes
    [[nodiscard]] std::uint64_t flush_count() const noexcept { return flush_count_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool on_worker_thread() const noexcept;

private:
    // How the origin phase ended, decided under io_mutex_
    struct Outcome {
        FetchState state{FetchState::completed};
        std::error_code ec;
    };

    void run() noexcept;
    [[nodiscard]] Outcome settle(std::error_code fetch_ec);

    // Serve [delivered, end) from the cache as far as it reaches
    [[nodiscard]] bool serve_cached_prefix();

    void deliver(std::uint64_t offset, std::span<const std::byte> data);

    // Origin phase; returns the fetch outcome
    [[nodiscard]] std::error_code fetch_remaining();

    // FetchHandlers
    [[nodiscard]] std::error_code on_response(const OriginResponse& response) override;
    [[nodiscard]] bool on_data(std::span<const std::byte> data) override;
    [[nodiscard]] bool should_stop() const override;

    // Write unsaved bytes; caller holds io_mutex_
    [[nodiscard]] std::error_code flush_locked() noexcept;

    void finish(FetchState state, std::error_code ec) noexcept;
    void mark_done() noexcept;
    void state(FetchState new_state) noexcept { state_.store(new_state, std::memory_order_release); }

    std::string url_;
    std::string key_;
    std::uint64_t offset_;                 // Requested start
    std::optional<std::uint64_t> end_;     // Requested end (exclusive), once known

    CacheService& cache_;
    OriginClient& origin_;
    CacheConfig config_;
    std::shared_ptr<CacheRecord> record_;  // Held for the whole fetch; a clear invalidates it

    BytesCallback on_bytes_;
    CompletionCallback on_complete_;
    std::function<void()> on_finished_;

    std::atomic<FetchState> state_{FetchState::created};
    std::error_code error_;                // Written once, before the terminal state
    mutable std::mutex error_mutex_;

    std::atomic<bool> stop_{false};
    std::atomic<bool> cancel_requested_{false};

    // Receive/flush bookkeeping, guarded by io_mutex_
    std::mutex io_mutex_;
    Bytes pending_;                        // Received, not yet saved
    std::uint64_t saved_offset_{0};        // Resource offset of pending_[0]
    std::uint64_t body_pos_{0};            // Resource offset of the next body byte
    std::uint64_t request_start_{0};       // Body bytes before this are dropped
    std::optional<std::uint64_t> expected_end_;  // Where the response body ends
    std::int32_t response_status_{0};
    bool reached_end_{false};              // Stopped on purpose at end_
    bool overflow_{false};                 // Body ran past what was announced
    std::error_code storage_error_;

    std::atomic<std::uint64_t> delivered_{0};
    std::atomic<std::uint64_t> saved_atomic_{0};
    std::atomic<std::uint64_t> flush_count_{0};

    std::mutex done_mutex_;
    std::condition_variable done_cv_;
    bool done_{false};

    std::atomic<std::thread::id> worker_id_{};  // Set by the worker itself
    std::jthread worker_;
};

} // namespace spool::core
