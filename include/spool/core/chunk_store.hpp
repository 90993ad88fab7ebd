// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <spool/disk/byte_store.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace spool::core {

using Bytes = std::vector<std::byte>;

// Physical chunk writes of one resource. The chunk table maps the offset a
// write began at to its length; it is independent of the merged RangeIndex,
// so one logical range may be backed by many chunks.
class ChunkStore {
public:
    using ChunkTable = std::map<std::uint64_t, std::uint64_t>;

    ChunkStore(disk::ByteStore& store, std::string key, ChunkTable chunks = {});

    // Store bytes at offset. The table changes only after the store accepted them.
    [[nodiscard]] std::error_code write_chunk(std::uint64_t offset, std::span<const std::byte> data) noexcept;

    // Reassemble [offset, offset + length) from the chunks covering it.
    // nullopt if any byte is not covered; an error if the store fails.
    [[nodiscard]] std::expected<std::optional<Bytes>, std::error_code>
    read_range(std::uint64_t offset, std::uint64_t length) const noexcept;

    [[nodiscard]] ChunkTable chunks() const;
    [[nodiscard]] std::size_t chunk_count() const noexcept;

    // Forget every chunk (the bytes themselves are removed by the owner)
    void reset() noexcept;

private:
    disk::ByteStore& store_;
    std::string key_;
    ChunkTable chunks_;
    mutable std::mutex mutex_;  // Protects chunks_, never held during I/O
};

} // namespace spool::core
