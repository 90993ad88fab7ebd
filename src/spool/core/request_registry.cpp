// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/request_registry.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace spool::core {

RequestRegistry::~RequestRegistry() {
    cancel_all();
}

std::error_code RequestRegistry::add(RequestHandle handle, std::unique_ptr<FetchCoordinator> coordinator) {
    const FetchCoordinator* raw = coordinator.get();
    coordinator->on_finished([this, handle, raw] { remove(handle, raw); });

    std::unique_ptr<FetchCoordinator> previous;
    std::vector<std::unique_ptr<FetchCoordinator>> reaped;
    {
        // Started under the lock so its finish hook cannot run before it is
        // registered; start() never waits on the worker
        auto lock = std::unique_lock(mutex_);
        if (auto ec = coordinator->start()) {
            return ec;
        }
        auto& slot = active_[handle];
        previous = std::move(slot);
        slot = std::move(coordinator);
        reaped = take_reapable_locked();
    }

    if (previous) {
        spdlog::debug("request {} replaced, cancelling the previous fetch", handle);
        previous->cancel();
        if (previous->on_worker_thread()) {
            auto lock = std::unique_lock(mutex_);
            retired_.push_back(std::move(previous));
        }
    }
    return {};
}

bool RequestRegistry::cancel(RequestHandle handle) noexcept {
    std::unique_ptr<FetchCoordinator> coordinator;
    std::vector<std::unique_ptr<FetchCoordinator>> reaped;
    {
        auto lock = std::unique_lock(mutex_);
        auto it = active_.find(handle);
        if (it == active_.end()) {
            return false;
        }
        coordinator = std::move(it->second);
        active_.erase(it);
        reaped = take_reapable_locked();
    }

    // Saves received bytes and joins the worker, outside the lock: the
    // worker may be about to call remove()
    coordinator->cancel();
    if (coordinator->on_worker_thread()) {
        try {
            auto lock = std::unique_lock(mutex_);
            retired_.push_back(std::move(coordinator));
        } catch (const std::bad_alloc&) {
            spdlog::error("could not retire request {}", handle);
            (void)coordinator.release();  // Leak rather than self-join
        }
    }
    return true;
}

void RequestRegistry::remove(RequestHandle handle, const FetchCoordinator* expected) noexcept {
    std::vector<std::unique_ptr<FetchCoordinator>> reaped;
    {
        auto lock = std::unique_lock(mutex_);
        auto it = active_.find(handle);
        if (it != active_.end() && (!expected || it->second.get() == expected)) {
            try {
                retired_.push_back(std::move(it->second));
            } catch (const std::bad_alloc&) {
                (void)it->second.release();  // Leak rather than self-join
            }
            active_.erase(it);
        }
        try {
            reaped = take_reapable_locked();
        } catch (const std::bad_alloc&) {
            // Reaped on a later call
        }
    }
}

void RequestRegistry::cancel_all() noexcept {
    std::map<RequestHandle, std::unique_ptr<FetchCoordinator>> active;
    std::vector<std::unique_ptr<FetchCoordinator>> retired;
    {
        auto lock = std::unique_lock(mutex_);
        active.swap(active_);
        retired.swap(retired_);
    }

    if (!active.empty()) {
        spdlog::debug("cancelling {} active requests", active.size());
    }
    for (auto& [handle, coordinator] : active) {
        coordinator->cancel();
    }
}

bool RequestRegistry::contains(RequestHandle handle) const noexcept {
    auto lock = std::unique_lock(mutex_);
    return active_.find(handle) != active_.end();
}

std::size_t RequestRegistry::size() const noexcept {
    auto lock = std::unique_lock(mutex_);
    return active_.size();
}

std::vector<std::unique_ptr<FetchCoordinator>> RequestRegistry::take_reapable_locked() {
    std::vector<std::unique_ptr<FetchCoordinator>> reaped;
    auto keep = std::stable_partition(retired_.begin(), retired_.end(),
        [](const std::unique_ptr<FetchCoordinator>& c) { return c->on_worker_thread(); });
    for (auto it = keep; it != retired_.end(); ++it) {
        reaped.push_back(std::move(*it));
    }
    retired_.erase(keep, retired_.end());
    return reaped;
}

} // namespace spool::core
