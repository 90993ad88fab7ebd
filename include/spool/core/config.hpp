// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace spool::core {

constexpr std::uint64_t DEFAULT_CHECKPOINT_THRESHOLD = 512 * 1024;       // 512 KB
constexpr std::uint64_t MIN_CHECKPOINT_THRESHOLD = 256 * 1024;           // 256 KB floor
constexpr std::uint64_t AGGRESSIVE_CHECKPOINT_THRESHOLD = 256 * 1024;    // less loss, more I/O
constexpr std::uint64_t CONSERVATIVE_CHECKPOINT_THRESHOLD = 1024 * 1024; // less I/O, more loss

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t MAX_REDIRECTS = 10;
constexpr bool FOLLOW_REDIRECTS = true;

constexpr std::size_t RECEIVE_BUFFER_SIZE = 256 * 1024;  // 256 KB

constexpr const char* DEFAULT_CACHE_DIR = "spool-cache";
constexpr const char* DEFAULT_USER_AGENT = "spool/0.1";

// Runtime configuration injected into the engine
struct CacheConfig {
    std::string cache_dir{DEFAULT_CACHE_DIR};
    std::uint64_t checkpoint_threshold{DEFAULT_CHECKPOINT_THRESHOLD};
    std::uint64_t min_checkpoint_threshold{MIN_CHECKPOINT_THRESHOLD};
    bool incremental_caching{true};   // Save while downloading, not only at the end
    bool sync_writes{true};           // fdatasync after every chunk write
    std::string user_agent{DEFAULT_USER_AGENT};

    [[nodiscard]] std::uint64_t effective_checkpoint_threshold() const noexcept {
        return std::max(checkpoint_threshold, min_checkpoint_threshold);
    }

    [[nodiscard]] static CacheConfig aggressive() {
        CacheConfig cfg;
        cfg.checkpoint_threshold = AGGRESSIVE_CHECKPOINT_THRESHOLD;
        return cfg;
    }

    [[nodiscard]] static CacheConfig conservative() {
        CacheConfig cfg;
        cfg.checkpoint_threshold = CONSERVATIVE_CHECKPOINT_THRESHOLD;
        return cfg;
    }
};

} // namespace spool::core
