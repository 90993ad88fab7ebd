// Copyright (c) 2026 changcheng967. All rights reserved.

#include <spool/core/content_meta.hpp>
#include <spool/core/error.hpp>
#include <nlohmann/json.hpp>

namespace spool::core {

namespace {

std::unexpected<std::error_code> corrupt() noexcept {
    return std::unexpected(make_error_code(CacheErrc::cache_corruption));
}

} // namespace

//=============================================================================
// ContentMetadata
//=============================================================================

void ContentMetadata::merge(const ContentMetadata& newer) {
    if (newer.content_length) {
        content_length = newer.content_length;
    }
    if (newer.content_type) {
        content_type = newer.content_type;
    }
    // A reply without Accept-Ranges does not undo a served 206
    supports_range_access = supports_range_access || newer.supports_range_access;
    if (newer.last_modified > last_modified) {
        last_modified = newer.last_modified;
    }
}

bool ranges_backed_by_chunks(const std::vector<CachedRange>& ranges,
                             const std::map<std::uint64_t, std::uint64_t>& chunks) noexcept {
    try {
        std::vector<CachedRange> extents;
        extents.reserve(chunks.size());
        for (const auto& [offset, length] : chunks) {
            extents.push_back({offset, length});
        }
        RangeIndex backing(std::move(extents));

        for (const auto& r : ranges) {
            if (!backing.contains(r.offset, r.length)) {
                return false;
            }
        }
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

//=============================================================================
// PersistedRecord
//=============================================================================

std::string PersistedRecord::to_json() const {
    nlohmann::json j;
    j["version"] = FORMAT_VERSION;
    j["key"] = key;
    j["revision"] = revision;

    if (metadata.content_length) {
        j["contentLength"] = *metadata.content_length;
    } else {
        j["contentLength"] = nullptr;
    }
    if (metadata.content_type) {
        j["contentType"] = *metadata.content_type;
    } else {
        j["contentType"] = nullptr;
    }
    j["isByteRangeAccessSupported"] = metadata.supports_range_access;
    j["lastModified"] = metadata.last_modified.time_since_epoch().count();

    auto cached = nlohmann::json::array();
    for (const auto& r : ranges) {
        cached.push_back({{"offset", r.offset}, {"length", r.length}});
    }
    j["cachedRanges"] = std::move(cached);

    auto table = nlohmann::json::array();
    for (const auto& [offset, length] : chunks) {
        table.push_back({{"offset", offset}, {"length", length}});
    }
    j["chunks"] = std::move(table);

    return j.dump(2);
}

std::expected<PersistedRecord, std::error_code>
PersistedRecord::from_json(std::string_view document) noexcept {
    try {
        auto j = nlohmann::json::parse(document);
        if (!j.is_object()) {
            return corrupt();
        }

        if (!j.contains("version") || j["version"].get<int>() != FORMAT_VERSION) {
            return corrupt();
        }
        if (!j.contains("key") || !j["key"].is_string()) {
            return corrupt();
        }

        PersistedRecord rec;
        rec.key = j["key"].get<std::string>();

        if (j.contains("revision")) {
            rec.revision = j["revision"].get<std::uint64_t>();
        }

        if (j.contains("contentLength") && !j["contentLength"].is_null()) {
            rec.metadata.content_length = j["contentLength"].get<std::uint64_t>();
        }
        if (j.contains("contentType") && !j["contentType"].is_null()) {
            rec.metadata.content_type = j["contentType"].get<std::string>();
        }
        if (j.contains("isByteRangeAccessSupported")) {
            rec.metadata.supports_range_access = j["isByteRangeAccessSupported"].get<bool>();
        }
        if (j.contains("lastModified")) {
            rec.metadata.last_modified = Timestamp(std::chrono::milliseconds(j["lastModified"].get<std::int64_t>()));
        }

        if (j.contains("cachedRanges")) {
            if (!j["cachedRanges"].is_array()) return corrupt();
            for (const auto& r : j["cachedRanges"]) {
                CachedRange range{r.at("offset").get<std::uint64_t>(), r.at("length").get<std::uint64_t>()};
                if (range.length == 0) return corrupt();
                rec.ranges.push_back(range);
            }
        }

        if (j.contains("chunks")) {
            if (!j["chunks"].is_array()) return corrupt();
            for (const auto& c : j["chunks"]) {
                auto offset = c.at("offset").get<std::uint64_t>();
                auto length = c.at("length").get<std::uint64_t>();
                if (length == 0) return corrupt();
                rec.chunks[offset] = length;
            }
        }

        rec.ranges = RangeIndex::normalize(std::move(rec.ranges));

        if (rec.metadata.content_length && !rec.ranges.empty() &&
            rec.ranges.back().end() > *rec.metadata.content_length) {
            return corrupt();
        }
        if (!ranges_backed_by_chunks(rec.ranges, rec.chunks)) {
            return corrupt();
        }

        return rec;
    } catch (const std::exception&) {
        return corrupt();
    }
}

} // namespace spool::core
