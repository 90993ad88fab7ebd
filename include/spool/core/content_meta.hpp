// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/core/range_index.hpp>
#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace spool::core {

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

[[nodiscard]] inline Timestamp now_timestamp() noexcept {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

// What the origin told us about a resource
struct ContentMetadata {
    std::optional<std::uint64_t> content_length;
    std::optional<std::string> content_type;
    bool supports_range_access{false};
    Timestamp last_modified{};

    // Fold a newer observation in; known fields are never erased, and
    // range support once seen stays until the record is cleared
    void merge(const ContentMetadata& newer);

    bool operator==(const ContentMetadata&) const = default;
};

// Everything persisted for one resource
struct PersistedRecord {
    static constexpr int FORMAT_VERSION = 1;

    std::string key;
    std::uint64_t revision{0};
    ContentMetadata metadata;
    std::vector<CachedRange> ranges;
    std::map<std::uint64_t, std::uint64_t> chunks;  // offset -> length

    // JSON document for the metadata store
    [[nodiscard]] std::string to_json() const;

    // Parse and validate; any malformed or inconsistent document is
    // CacheErrc::cache_corruption
    [[nodiscard]] static std::expected<PersistedRecord, std::error_code>
    from_json(std::string_view document) noexcept;
};

// True iff every range is covered by the union of the chunks
[[nodiscard]] bool ranges_backed_by_chunks(const std::vector<CachedRange>& ranges,
                                           const std::map<std::uint64_t, std::uint64_t>& chunks) noexcept;

} // namespace spool::core
