// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/cache_service.hpp>
#include <spool/core/request_registry.hpp>
#include "fake_origin.hpp"
#include <atomic>
#include <memory>

using namespace spool::core;
using spool::test::FakeOrigin;
using spool::test::eventually;
using spool::test::make_content;

namespace {

constexpr const char* URL = "https://example.com/video.mp4";

struct Fixture {
    Fixture() {
        config.checkpoint_threshold = 16 * 1024;
        config.min_checkpoint_threshold = 16 * 1024;
    }

    std::unique_ptr<FetchCoordinator> make(std::string key, OriginClient& origin, ByteRange range) {
        return std::make_unique<FetchCoordinator>(
            URL, std::move(key), range, cache, origin, config,
            nullptr, [this](std::error_code) { completions.fetch_add(1); });
    }

    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    CacheService cache{bytes, metadata};
    CacheConfig config;
    std::atomic<int> completions{0};
};

} // namespace

TEST_CASE("RequestRegistry hands out distinct handles", "[request_registry]") {
    RequestRegistry registry;
    auto a = registry.next_handle();
    auto b = registry.next_handle();
    CHECK(a != b);
    CHECK(a != 0);
}

TEST_CASE("RequestRegistry drops a request once it finishes", "[request_registry]") {
    Fixture f;
    FakeOrigin origin(make_content(4000));
    RequestRegistry registry;

    auto handle = registry.next_handle();
    REQUIRE_FALSE(registry.add(handle, f.make("a", origin, {0, 4000})));

    CHECK(eventually([&] { return !registry.contains(handle); }));
    CHECK(registry.size() == 0);
    CHECK(f.completions == 1);
    CHECK(f.cache.is_range_cached("a", 0, 4000));
}

TEST_CASE("RequestRegistry registers nothing when start fails", "[request_registry]") {
    Fixture f;
    FakeOrigin origin(make_content(100));
    RequestRegistry registry;

    auto handle = registry.next_handle();
    CHECK(registry.add(handle, f.make("a", origin, {0, 0})) == CacheErrc::invalid_range);
    CHECK_FALSE(registry.contains(handle));
    CHECK(f.completions == 0);
}

TEST_CASE("RequestRegistry::cancel", "[request_registry]") {
    Fixture f;
    FakeOrigin origin(make_content(40000));
    origin.chunk_size = 1000;
    origin.block_after = 5000;
    RequestRegistry registry;

    CHECK_FALSE(registry.cancel(12345));

    auto handle = registry.next_handle();
    REQUIRE_FALSE(registry.add(handle, f.make("a", origin, {0, 40000})));
    REQUIRE(origin.wait_until_blocked());

    CHECK(registry.cancel(handle));
    CHECK_FALSE(registry.contains(handle));
    CHECK_FALSE(registry.cancel(handle));

    // Received bytes were saved, and no completion after a cancel
    CHECK(f.cache.cached_ranges("a") == std::vector<CachedRange>{{0, 5000}});
    CHECK(f.completions == 0);
}

TEST_CASE("RequestRegistry replaces a live request under the same handle", "[request_registry]") {
    Fixture f;
    FakeOrigin stalled(make_content(40000));
    stalled.chunk_size = 1000;
    stalled.block_after = 3000;
    FakeOrigin second(make_content(2000));
    RequestRegistry registry;

    auto handle = registry.next_handle();
    REQUIRE_FALSE(registry.add(handle, f.make("old", stalled, {0, 40000})));
    REQUIRE(stalled.wait_until_blocked());

    REQUIRE_FALSE(registry.add(handle, f.make("new", second, {0, 2000})));

    // The replaced fetch kept what it had
    CHECK(f.cache.cached_ranges("old") == std::vector<CachedRange>{{0, 3000}});
    CHECK(eventually([&] { return !registry.contains(handle); }));
    CHECK(f.cache.is_range_cached("new", 0, 2000));
    CHECK(f.completions == 1);
}

TEST_CASE("RequestRegistry cancels everything on destruction", "[request_registry]") {
    Fixture f;
    FakeOrigin first(make_content(40000));
    first.chunk_size = 1000;
    first.block_after = 2000;
    FakeOrigin second(make_content(40000));
    second.chunk_size = 1000;
    second.block_after = 7000;

    {
        RequestRegistry registry;
        REQUIRE_FALSE(registry.add(registry.next_handle(), f.make("a", first, {0, 40000})));
        REQUIRE_FALSE(registry.add(registry.next_handle(), f.make("b", second, {0, 40000})));
        REQUIRE(first.wait_until_blocked());
        REQUIRE(second.wait_until_blocked());
        CHECK(registry.size() == 2);
    }

    CHECK(f.cache.cached_ranges("a") == std::vector<CachedRange>{{0, 2000}});
    CHECK(f.cache.cached_ranges("b") == std::vector<CachedRange>{{0, 7000}});
    CHECK(f.completions == 0);
}
