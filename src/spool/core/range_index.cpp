// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/range_index.hpp>
#include <spool/core/format.hpp>
#include <algorithm>

namespace spool::core {

RangeIndex::RangeIndex(std::vector<CachedRange> ranges)
    : ranges_(normalize(std::move(ranges))) {}

std::vector<CachedRange> RangeIndex::normalize(std::vector<CachedRange> ranges) {
    std::erase_if(ranges, [](const CachedRange& r) { return r.length == 0; });
    if (ranges.size() < 2) return ranges;

    std::sort(ranges.begin(), ranges.end(),
        [](const CachedRange& a, const CachedRange& b) { return a.offset < b.offset; });

    std::vector<CachedRange> merged;
    merged.reserve(ranges.size());
    CachedRange current = ranges.front();

    for (std::size_t i = 1; i < ranges.size(); ++i) {
        const auto& next = ranges[i];
        if (next.offset <= current.end()) {
            // Overlapping or adjacent
            current.length = std::max(current.end(), next.end()) - current.offset;
        } else {
            merged.push_back(current);
            current = next;
        }
    }
    merged.push_back(current);
    return merged;
}

bool RangeIndex::contains(std::uint64_t offset, std::uint64_t length) const noexcept {
    if (length == 0) return false;

    // First range starting after offset; the candidate is the one before it
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), offset,
        [](std::uint64_t off, const CachedRange& r) { return off < r.offset; });
    if (it == ranges_.begin()) return false;
    --it;
    return it->contains(offset, length);
}

bool RangeIndex::overlaps(std::uint64_t offset, std::uint64_t length) const noexcept {
    if (length == 0) return false;
    CachedRange probe{offset, length};
    return std::any_of(ranges_.begin(), ranges_.end(),
        [&probe](const CachedRange& r) { return r.overlaps(probe); });
}

const std::vector<CachedRange>& RangeIndex::insert(std::uint64_t offset, std::uint64_t length) {
    if (length == 0) return ranges_;

    auto ranges = ranges_;
    ranges.push_back({offset, length});
    ranges_ = normalize(std::move(ranges));
    return ranges_;
}

std::optional<std::uint64_t> RangeIndex::contiguous_end(std::uint64_t offset) const noexcept {
    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), offset,
        [](std::uint64_t off, const CachedRange& r) { return off < r.offset; });
    if (it == ranges_.begin()) return std::nullopt;
    --it;
    if (offset < it->end()) {
        return it->end();
    }
    return std::nullopt;
}

std::uint64_t RangeIndex::cached_bytes() const noexcept {
    std::uint64_t total = 0;
    for (const auto& r : ranges_) {
        total += r.length;
    }
    return total;
}

std::string RangeIndex::describe() const {
    if (ranges_.empty()) return "no cached ranges";

    std::string out;
    for (const auto& r : ranges_) {
        if (!out.empty()) out += ", ";
        out += "[" + format_bytes(r.offset) + " - " + format_bytes(r.end()) + "] ("
             + format_bytes(r.length) + ")";
    }
    return out;
}

} // namespace spool::core
