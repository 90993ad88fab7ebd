// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace spool::core {

// Half-open byte interval [offset, offset + length) known to be downloaded
struct CachedRange {
    std::uint64_t offset{0};
    std::uint64_t length{0};

    [[nodiscard]] std::uint64_t end() const noexcept { return offset + length; }

    [[nodiscard]] bool contains(std::uint64_t off, std::uint64_t len) const noexcept {
        return off >= offset && off + len <= end();
    }

    [[nodiscard]] bool overlaps(const CachedRange& other) const noexcept {
        return offset < other.end() && other.offset < end();
    }

    [[nodiscard]] bool adjacent_to(const CachedRange& other) const noexcept {
        return end() == other.offset || other.end() == offset;
    }

    bool operator==(const CachedRange&) const = default;
};

// Sorted, non-overlapping, non-adjacent set of cached ranges for one resource.
// Every mutation re-normalizes the set.
class RangeIndex {
public:
    RangeIndex() = default;

    // Build from an arbitrary (possibly unsorted, overlapping) list
    explicit RangeIndex(std::vector<CachedRange> ranges);

    // True iff a single range fully covers [offset, offset + length)
    [[nodiscard]] bool contains(std::uint64_t offset, std::uint64_t length) const noexcept;

    // True iff any range intersects [offset, offset + length)
    [[nodiscard]] bool overlaps(std::uint64_t offset, std::uint64_t length) const noexcept;

    // Add a covered range, merging with overlapping or adjacent ranges
    const std::vector<CachedRange>& insert(std::uint64_t offset, std::uint64_t length);

    // End of the range covering `offset`, if any
    [[nodiscard]] std::optional<std::uint64_t> contiguous_end(std::uint64_t offset) const noexcept;

    // Sum of all range lengths
    [[nodiscard]] std::uint64_t cached_bytes() const noexcept;

    [[nodiscard]] const std::vector<CachedRange>& ranges() const noexcept { return ranges_; }
    [[nodiscard]] bool empty() const noexcept { return ranges_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return ranges_.size(); }

    void clear() noexcept { ranges_.clear(); }

    // "[0-1.0 MB] (1.0 MB), ..." for logs and the CLI
    [[nodiscard]] std::string describe() const;

    // Sort and merge; zero-length entries are dropped
    [[nodiscard]] static std::vector<CachedRange> normalize(std::vector<CachedRange> ranges);

private:
    std::vector<CachedRange> ranges_;
};

} // namespace spool::core
