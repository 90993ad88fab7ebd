// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/chunk_store.hpp>
#include <spool/core/error.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <new>

namespace spool::core {

namespace {

struct Piece {
    std::uint64_t offset;
    std::uint64_t length;
};

} // namespace

ChunkStore::ChunkStore(disk::ByteStore& store, std::string key, ChunkTable chunks)
    : store_(store)
    , key_(std::move(key))
    , chunks_(std::move(chunks)) {}

std::error_code ChunkStore::write_chunk(std::uint64_t offset, std::span<const std::byte> data) noexcept {
    if (data.empty()) {
        return {};
    }

    auto ec = store_.write(key_, offset, data);
    if (ec) {
        return ec;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& length = chunks_[offset];
    length = std::max<std::uint64_t>(length, data.size());
    return {};
}

std::expected<std::optional<Bytes>, std::error_code>
ChunkStore::read_range(std::uint64_t offset, std::uint64_t length) const noexcept {
    if (length == 0) {
        return std::optional<Bytes>(Bytes{});
    }

    try {
        const std::uint64_t end = offset + length;

        // Plan the pieces under the lock, read them without it
        std::vector<Piece> pieces;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::uint64_t cursor = offset;
            for (const auto& [chunk_offset, chunk_length] : chunks_) {
                if (chunk_offset > cursor) break;  // Gap: later chunks start even later

                const std::uint64_t chunk_end = chunk_offset + chunk_length;
                if (chunk_end <= cursor) continue;

                const std::uint64_t piece_end = std::min(chunk_end, end);
                pieces.push_back({cursor, piece_end - cursor});
                cursor = piece_end;
                if (cursor >= end) break;
            }
            if (cursor < end) {
                return std::optional<Bytes>{};
            }
        }

        Bytes out(length);
        for (const auto& piece : pieces) {
            std::span<std::byte> dest(out.data() + (piece.offset - offset), piece.length);
            auto n = store_.read(key_, piece.offset, dest);
            if (!n) {
                spdlog::error("chunk read failed for {} at {}: {}", key_, piece.offset, n.error().message());
                return std::unexpected(make_error_code(CacheErrc::storage_read_error));
            }
            if (*n != piece.length) {
                spdlog::error("short chunk read for {} at {}: {} of {} bytes",
                              key_, piece.offset, *n, piece.length);
                return std::unexpected(make_error_code(CacheErrc::storage_read_error));
            }
        }
        return std::optional<Bytes>(std::move(out));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(CacheErrc::storage_read_error));
    }
}

ChunkStore::ChunkTable ChunkStore::chunks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_;
}

std::size_t ChunkStore::chunk_count() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return chunks_.size();
}

void ChunkStore::reset() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    chunks_.clear();
}

} // namespace spool::core
