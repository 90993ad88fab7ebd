// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/cache_engine.hpp>
#include <spool/core/error.hpp>
#include "fake_origin.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>

using namespace spool::core;
using spool::test::FakeOrigin;
using spool::test::eventually;
using spool::test::make_content;
using spool::test::slice;

namespace {

constexpr const char* URL = "https://example.com/video.mp4";

CacheConfig test_config() {
    CacheConfig config;
    config.checkpoint_threshold = 16 * 1024;
    config.min_checkpoint_threshold = 16 * 1024;
    return config;
}

// Runs one request to completion and returns what the caller received
struct Collector {
    std::mutex mutex;
    Bytes received;
    std::promise<std::error_code> done;

    BytesCallback bytes() {
        return [this](std::uint64_t, std::span<const std::byte> data) {
            std::lock_guard<std::mutex> lock(mutex);
            received.insert(received.end(), data.begin(), data.end());
        };
    }

    CompletionCallback completion() {
        return [this](std::error_code ec) { done.set_value(ec); };
    }

    std::error_code wait() {
        auto future = done.get_future();
        REQUIRE(future.wait_for(std::chrono::seconds(10)) == std::future_status::ready);
        return future.get();
    }
};

} // namespace

TEST_CASE("CacheEngine fetches, then serves from cache", "[cache_engine]") {
    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    FakeOrigin origin(make_content(40000));
    CacheEngine engine(test_config(), bytes, metadata, origin);

    Collector first;
    auto handle = engine.begin_fetch(URL, {0, 40000}, first.bytes(), first.completion());
    REQUIRE(handle.has_value());
    CHECK_FALSE(first.wait());
    CHECK(first.received == origin.content());

    auto status = engine.status(URL);
    REQUIRE(status.has_value());
    CHECK(status->is_fully_cached);
    CHECK(status->percent_cached == Catch::Approx(100.0));
    CHECK(status->cached_bytes == 40000);
    CHECK(status->content_length == 40000u);
    CHECK(eventually([&] { return engine.active_requests() == 0; }));

    // Same resource, spelled differently
    Collector second;
    REQUIRE(engine.begin_fetch("HTTPS://EXAMPLE.com:443/video.mp4#t=1", {1000, 500},
                               second.bytes(), second.completion()).has_value());
    CHECK_FALSE(second.wait());
    CHECK(second.received == slice(origin.content(), 1000, 500));
    CHECK(origin.request_count() == 1);

    auto hit = engine.probe(URL, 39000, 1000);
    REQUIRE(hit.has_value());
    CHECK(hit->is_full());
}

TEST_CASE("CacheEngine rejects bad requests up front", "[cache_engine]") {
    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    FakeOrigin origin(make_content(100));
    CacheEngine engine(test_config(), bytes, metadata, origin);

    auto bad_url = engine.begin_fetch("not a url", {0, 10}, nullptr, nullptr);
    REQUIRE_FALSE(bad_url.has_value());
    CHECK(bad_url.error() == CacheErrc::invalid_url);

    auto empty = engine.begin_fetch(URL, {0, 0}, nullptr, nullptr);
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error() == CacheErrc::invalid_range);

    CHECK(engine.status("not a url").error() == CacheErrc::invalid_url);
    CHECK(engine.active_requests() == 0);
    CHECK(origin.request_count() == 0);
}

TEST_CASE("CacheEngine::content_info", "[cache_engine]") {
    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    FakeOrigin origin(make_content(5000));
    CacheEngine engine(test_config(), bytes, metadata, origin);

    auto info = engine.content_info(URL);
    REQUIRE(info.has_value());
    CHECK(info->content_length == 5000u);
    CHECK(info->content_type == "video/mp4");
    CHECK(info->supports_range_access);

    auto requests = origin.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].start == 0);
    CHECK(requests[0].end_inclusive == 1u);

    // Answered from the cache the second time
    REQUIRE(engine.content_info(URL).has_value());
    CHECK(origin.request_count() == 1);

    SECTION("Unreachable origin") {
        FakeOrigin down(make_content(10));
        down.fail_with = make_error_code(CacheErrc::dns_error);
        CacheEngine other(test_config(), bytes, metadata, down);
        auto result = other.content_info("https://example.com/other.mp4");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == CacheErrc::dns_error);
    }
}

TEST_CASE("CacheEngine cancel and handle reuse", "[cache_engine]") {
    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    FakeOrigin origin(make_content(40000));
    origin.chunk_size = 1000;
    origin.block_after = 6000;
    CacheEngine engine(test_config(), bytes, metadata, origin);

    REQUIRE_FALSE(engine.begin_fetch(7, URL, ByteRange::to_end(0), nullptr, nullptr));
    REQUIRE(origin.wait_until_blocked());
    CHECK(engine.is_active(7));

    SECTION("Cancel saves what arrived") {
        CHECK(engine.cancel(7));
        CHECK_FALSE(engine.is_active(7));
        CHECK_FALSE(engine.cancel(7));

        auto status = engine.status(URL);
        REQUIRE(status.has_value());
        CHECK(status->cached_bytes == 6000);
        CHECK(status->percent_cached == Catch::Approx(15.0));
        CHECK(engine.describe_ranges(URL) == std::string("[0 B - 6 KB] (6 KB)"));
    }

    SECTION("A new request under the same handle replaces the old one") {
        Collector replacement;
        REQUIRE_FALSE(engine.begin_fetch(7, URL, {0, 3000}, replacement.bytes(), replacement.completion()));
        CHECK_FALSE(replacement.wait());
        CHECK(replacement.received == slice(origin.content(), 0, 3000));
        CHECK(engine.status(URL)->cached_bytes == 6000);
    }
}

TEST_CASE("CacheEngine::clear", "[cache_engine]") {
    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    FakeOrigin origin(make_content(2000));
    CacheEngine engine(test_config(), bytes, metadata, origin);

    Collector fetch;
    REQUIRE(engine.begin_fetch(URL, {0, 2000}, fetch.bytes(), fetch.completion()).has_value());
    CHECK_FALSE(fetch.wait());
    REQUIRE(engine.status(URL)->is_fully_cached);

    REQUIRE_FALSE(engine.clear(URL));
    auto status = engine.status(URL);
    REQUIRE(status.has_value());
    CHECK(status->cached_bytes == 0);
    CHECK_FALSE(status->content_length.has_value());
    CHECK(engine.probe(URL, 0, 10)->is_miss());

    CHECK(engine.clear("::") == CacheErrc::invalid_url);
    REQUIRE_FALSE(engine.clear_all());
    CHECK(engine.cache_size() == 0);
}

TEST_CASE("CacheEngine shutdown saves in-flight requests", "[cache_engine]") {
    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    FakeOrigin origin(make_content(40000));
    origin.chunk_size = 1000;
    origin.block_after = 9000;

    {
        CacheEngine engine(test_config(), bytes, metadata, origin);
        REQUIRE(engine.begin_fetch(URL, {0, 40000}, nullptr, nullptr).has_value());
        REQUIRE(origin.wait_until_blocked());
    }

    CacheService reopened(bytes, metadata);
    CHECK(reopened.cached_ranges(URL) == std::vector<CachedRange>{{0, 9000}});
    CHECK(reopened.content_metadata(URL)->content_length == 40000u);
}
