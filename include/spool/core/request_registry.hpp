// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/fetch_coordinator.hpp>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace spool::core {

using RequestHandle = std::uint64_t;

// Active fetches keyed by request handle. Coordinators are never destroyed
// under the registry lock or on their own worker thread: finished ones are
// retired and reaped later from another thread.
class RequestRegistry {
public:
    RequestRegistry() = default;

    // Cancels every registered fetch so each saves what it received
    ~RequestRegistry();

    RequestRegistry(const RequestRegistry&) = delete;
    RequestRegistry& operator=(const RequestRegistry&) = delete;

    // Fresh handle, never reused
    [[nodiscard]] RequestHandle next_handle() noexcept { return next_handle_.fetch_add(1, std::memory_order_relaxed); }

    // Start and register a coordinator; a live one under the same handle
    // is cancelled and replaced. Nothing is registered if start() fails.
    // The coordinator removes itself when it completes or fails.
    [[nodiscard]] std::error_code add(RequestHandle handle, std::unique_ptr<FetchCoordinator> coordinator);

    // Cancel and drop; false if the handle is not registered
    bool cancel(RequestHandle handle) noexcept;

    // Drop without cancelling. With `expected`, only if that coordinator
    // is still the one registered under handle.
    void remove(RequestHandle handle, const FetchCoordinator* expected = nullptr) noexcept;

    void cancel_all() noexcept;

    [[nodiscard]] bool contains(RequestHandle handle) const noexcept;
    [[nodiscard]] std::size_t size() const noexcept;

private:
    // Retired coordinators this thread may destroy; caller holds mutex_
    [[nodiscard]] std::vector<std::unique_ptr<FetchCoordinator>> take_reapable_locked();

    std::map<RequestHandle, std::unique_ptr<FetchCoordinator>> active_;
    std::vector<std::unique_ptr<FetchCoordinator>> retired_;
    std::atomic<RequestHandle> next_handle_{1};
    mutable std::mutex mutex_;
};

} // namespace spool::core
