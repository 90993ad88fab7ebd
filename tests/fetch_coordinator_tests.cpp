// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/cache_service.hpp>
#include <spool/core/error.hpp>
#include <spool/core/fetch_coordinator.hpp>
#include "fake_origin.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

using namespace spool::core;
using spool::test::FakeOrigin;
using spool::test::make_content;
using spool::test::slice;

namespace {

constexpr const char* URL = "https://example.com/video.mp4";
constexpr const char* KEY = "https://example.com/video.mp4";

// One cache, one origin, and what the caller saw
struct Harness {
    explicit Harness(std::size_t size) : origin(make_content(size)) {
        config.checkpoint_threshold = 16 * 1024;
        config.min_checkpoint_threshold = 16 * 1024;
        config.sync_writes = false;
        origin.chunk_size = 1000;
    }

    std::unique_ptr<FetchCoordinator> make(ByteRange range, spool::disk::ByteStore* store = nullptr) {
        auto& target = store ? *store : static_cast<spool::disk::ByteStore&>(bytes);
        if (store) {
            alt_cache = std::make_unique<CacheService>(target, metadata);
        }
        CacheService& c = store ? *alt_cache : cache;
        return std::make_unique<FetchCoordinator>(
            URL, KEY, range, c, origin, config,
            [this](std::uint64_t offset, std::span<const std::byte> data) {
                std::lock_guard<std::mutex> lock(mutex);
                if (received.empty()) first_offset = offset;
                received.insert(received.end(), data.begin(), data.end());
                if (on_bytes) on_bytes(received.size());
            },
            [this](std::error_code ec) {
                std::lock_guard<std::mutex> lock(mutex);
                ++completions;
                completion = ec;
            });
    }

    const Bytes& content() const { return origin.content(); }

    void seed(std::uint64_t offset, std::uint64_t length) {
        REQUIRE_FALSE(cache.store_chunk(KEY, offset, std::span<const std::byte>(content()).subspan(offset, length)));
    }

    void seed_length(std::uint64_t length) {
        ContentMetadata meta;
        meta.content_length = length;
        meta.supports_range_access = true;
        REQUIRE_FALSE(cache.update_content_metadata(KEY, meta));
    }

    spool::disk::MemoryByteStore bytes;
    MemoryMetadataBackend metadata;
    CacheService cache{bytes, metadata};
    std::unique_ptr<CacheService> alt_cache;
    FakeOrigin origin;
    CacheConfig config;

    std::mutex mutex;
    Bytes received;
    std::optional<std::uint64_t> first_offset;
    int completions{0};
    std::optional<std::error_code> completion;
    std::function<void(std::size_t)> on_bytes;
};

} // namespace

TEST_CASE("FetchCoordinator fetches a miss from the origin", "[fetch_coordinator]") {
    Harness h(40000);
    auto fetch = h.make({0, 40000});
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::completed);
    CHECK(h.completions == 1);
    CHECK(h.completion == std::error_code{});
    CHECK(h.received == h.content());

    auto requests = h.origin.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].start == 0);
    CHECK(requests[0].end_inclusive == 39999u);

    // Checkpoints at 17000 and 34000, then the final 6000
    CHECK(fetch->flush_count() == 3);
    CHECK(fetch->saved_offset() == 40000);
    CHECK(h.cache.is_fully_cached(KEY));
    CHECK(h.cache.content_metadata(KEY)->content_type == "video/mp4");
}

TEST_CASE("FetchCoordinator serves a full hit without the network", "[fetch_coordinator]") {
    Harness h(1000);
    h.seed(0, 1000);

    auto fetch = h.make({100, 500});
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::completed);
    CHECK(h.origin.request_count() == 0);
    CHECK(h.received == slice(h.content(), 100, 500));
    CHECK(h.first_offset == 100u);
    CHECK(h.completions == 1);
}

TEST_CASE("FetchCoordinator serves the cached prefix, then fetches the rest", "[fetch_coordinator]") {
    Harness h(4000);
    h.seed(0, 1000);

    auto fetch = h.make({0, 4000});
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::completed);
    CHECK(h.received == h.content());

    auto requests = h.origin.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].start == 1000);
    CHECK(requests[0].end_inclusive == 3999u);
    CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 4000}});
}

TEST_CASE("FetchCoordinator open-ended requests", "[fetch_coordinator]") {
    SECTION("Known length") {
        Harness h(4000);
        h.seed_length(4000);
        h.seed(0, 1000);

        auto fetch = h.make(ByteRange::to_end(500));
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::completed);
        CHECK(h.received == slice(h.content(), 500, 3500));
        auto requests = h.origin.requests();
        REQUIRE(requests.size() == 1);
        CHECK(requests[0].start == 1000);
        CHECK(requests[0].end_inclusive == 3999u);
    }

    SECTION("Unknown length is learned from a whole-resource body") {
        Harness h(4000);
        h.origin.ignore_range = true;
        h.origin.unknown_total = true;

        auto fetch = h.make(ByteRange::to_end(0));
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::completed);
        CHECK(h.received == h.content());
        auto requests = h.origin.requests();
        REQUIRE(requests.size() == 1);
        CHECK_FALSE(requests[0].end_inclusive.has_value());
        CHECK(h.cache.content_metadata(KEY)->content_length == 4000u);
        CHECK(h.cache.is_fully_cached(KEY));
    }

    SECTION("A partial reply of unknown total does not fix the length") {
        Harness h(4000);
        h.origin.unknown_total = true;
        h.origin.cap_body = 1500;

        auto fetch = h.make(ByteRange::to_end(0));
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::completed);
        CHECK(h.received == slice(h.content(), 0, 1500));
        CHECK_FALSE(h.cache.content_metadata(KEY)->content_length.has_value());
        CHECK_FALSE(h.cache.is_fully_cached(KEY));
        CHECK(h.cache.percent_cached(KEY) == 0.0);
    }

    SECTION("Starting exactly at the end is empty") {
        Harness h(1000);
        h.seed_length(1000);

        auto fetch = h.make(ByteRange::to_end(1000));
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::completed);
        CHECK(h.received.empty());
        CHECK(h.origin.request_count() == 0);
    }

    SECTION("Starting past the end is rejected") {
        Harness h(1000);
        h.seed_length(1000);

        auto fetch = h.make(ByteRange::to_end(1001));
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::invalid_range));
    }
}

TEST_CASE("FetchCoordinator rejects a zero-length range", "[fetch_coordinator]") {
    Harness h(1000);
    auto fetch = h.make({10, 0});

    CHECK(fetch->start() == CacheErrc::invalid_range);
    CHECK(fetch->state() == FetchState::failed);
    CHECK(fetch->error() == CacheErrc::invalid_range);
    fetch->wait();
    CHECK(h.completions == 0);
    CHECK(h.origin.request_count() == 0);
}

TEST_CASE("FetchCoordinator keeps what arrived before a failure", "[fetch_coordinator]") {
    SECTION("Network error") {
        Harness h(10000);
        h.origin.fail_after = 2500;

        auto fetch = h.make({0, 10000});
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::network_error));
        CHECK(h.received.size() == 2500);
        CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 2500}});
        CHECK(h.origin.request_count() == 1);  // No automatic retry
    }

    SECTION("Body shorter than announced") {
        Harness h(4000);
        h.origin.end_early_after = 1500;

        auto fetch = h.make({0, 4000});
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::network_error));
        CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 1500}});
    }

    SECTION("Origin unreachable") {
        Harness h(4000);
        h.origin.fail_with = make_error_code(CacheErrc::dns_error);

        auto fetch = h.make({0, 4000});
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::dns_error));
        CHECK(h.cache.cached_bytes(KEY) == 0);
    }
}

TEST_CASE("FetchCoordinator fails when the origin answers less than was asked", "[fetch_coordinator]") {
    Harness h(4000);
    h.origin.cap_body = 500;

    SECTION("Bounded range") {
        auto fetch = h.make({0, 1000});
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::network_error));
        CHECK(h.received == slice(h.content(), 0, 500));
        CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 500}});
    }

    SECTION("Open-ended range of known total") {
        auto fetch = h.make(ByteRange::to_end(0));
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::network_error));
        CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 500}});
        CHECK(h.cache.content_metadata(KEY)->content_length == 4000u);
        CHECK_FALSE(h.cache.is_fully_cached(KEY));
    }
}

TEST_CASE("FetchCoordinator refuses a response that contradicts the cached length", "[fetch_coordinator]") {
    Harness h(4000);
    h.seed_length(5000);

    auto fetch = h.make({0, 1000});
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::failed);
    CHECK(h.completion == make_error_code(CacheErrc::range_mismatch));
    CHECK(h.received.empty());
    CHECK(h.cache.cached_bytes(KEY) == 0);
    CHECK(h.cache.content_metadata(KEY)->content_length == 5000u);
}

TEST_CASE("FetchCoordinator accepts a 200 reply to a ranged request", "[fetch_coordinator]") {
    Harness h(4000);
    h.origin.ignore_range = true;

    auto fetch = h.make({1000, 2000});
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::completed);
    CHECK(h.received == slice(h.content(), 1000, 2000));
    CHECK(h.first_offset == 1000u);
    CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{1000, 2000}});

    auto meta = h.cache.content_metadata(KEY);
    REQUIRE(meta.has_value());
    CHECK(meta->content_length == 4000u);
    CHECK_FALSE(meta->supports_range_access);
}

TEST_CASE("FetchCoordinator checkpoints bound the loss of a killed fetch", "[fetch_coordinator]") {
    Harness h(40000);
    h.origin.block_after = 39000;

    auto fetch = h.make({0, 40000});
    REQUIRE_FALSE(fetch->start());
    REQUIRE(h.origin.wait_until_blocked());

    // What a fresh process would find on disk right now
    h.cache.sync();
    CacheService after_restart(h.bytes, h.metadata);
    const std::uint64_t survived = after_restart.cached_bytes(KEY);
    CHECK(survived >= 40000 - 16384);
    CHECK(survived == fetch->saved_offset());

    auto bytes = after_restart.read_range(KEY, 0, survived);
    REQUIRE(bytes.has_value());
    REQUIRE(bytes->has_value());
    CHECK(**bytes == slice(h.content(), 0, survived));

    fetch->cancel();
}

TEST_CASE("FetchCoordinator saves on cancel", "[fetch_coordinator]") {
    Harness h(40000);
    h.config.incremental_caching = false;
    h.origin.block_after = 10000;

    auto fetch = h.make({0, 40000});
    REQUIRE_FALSE(fetch->start());
    REQUIRE(h.origin.wait_until_blocked());

    SECTION("Double cancel flushes exactly once") {
        fetch->cancel();
        fetch->cancel();
    }

    SECTION("Concurrent cancels flush exactly once") {
        std::thread other([&] { fetch->cancel(); });
        fetch->cancel();
        other.join();
        fetch->wait();
    }

    CHECK(fetch->state() == FetchState::cancelled);
    CHECK(fetch->flush_count() == 1);
    CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 10000}});
    CHECK(h.completions == 0);
}

TEST_CASE("FetchCoordinator can be cancelled from its bytes callback", "[fetch_coordinator]") {
    Harness h(10000);
    FetchCoordinator* self = nullptr;
    h.on_bytes = [&self](std::size_t received) {
        if (received >= 3000) self->cancel();
    };

    auto fetch = h.make({0, 10000});
    self = fetch.get();
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::cancelled);
    CHECK(h.completions == 0);
    CHECK(h.received.size() == 3000);
    CHECK(h.cache.cached_ranges(KEY) == std::vector<CachedRange>{{0, 3000}});
}

TEST_CASE("FetchCoordinator fails on storage errors", "[fetch_coordinator]") {
    spool::test::FaultyByteStore faulty;  // Outlives the cache built on it
    faulty.fail_writes = true;
    Harness h(40000);

    SECTION("Final save") {
        auto fetch = h.make({0, 4000}, &faulty);
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::storage_write_error));
        CHECK(h.received.size() == 4000);
        CHECK(h.alt_cache->cached_bytes(KEY) == 0);
    }

    SECTION("Checkpoint aborts the transfer") {
        auto fetch = h.make({0, 40000}, &faulty);
        REQUIRE_FALSE(fetch->start());
        fetch->wait();

        CHECK(fetch->state() == FetchState::failed);
        CHECK(h.completion == make_error_code(CacheErrc::storage_write_error));
        CHECK(h.received.size() == 17000);
        CHECK(fetch->saved_offset() == 0);
        CHECK(h.alt_cache->cached_bytes(KEY) == 0);
    }
}

TEST_CASE("FetchCoordinator stops caching after a clear", "[fetch_coordinator]") {
    Harness h(10000);
    h.origin.block_after = 5000;

    auto fetch = h.make({0, 10000});
    REQUIRE_FALSE(fetch->start());
    REQUIRE(h.origin.wait_until_blocked());

    REQUIRE_FALSE(h.cache.clear(KEY));
    h.origin.release();
    fetch->wait();

    CHECK(fetch->state() == FetchState::completed);
    CHECK(h.received == h.content());
    h.cache.sync();
    CHECK(h.cache.cached_bytes(KEY) == 0);
    CHECK_FALSE(h.metadata.load(KEY).has_value());
}

TEST_CASE("FetchCoordinator without incremental caching saves once", "[fetch_coordinator]") {
    Harness h(40000);
    h.config.incremental_caching = false;

    auto fetch = h.make({0, 40000});
    REQUIRE_FALSE(fetch->start());
    fetch->wait();

    CHECK(fetch->state() == FetchState::completed);
    CHECK(fetch->flush_count() == 1);
    CHECK(h.cache.is_fully_cached(KEY));
}

TEST_CASE("FetchCoordinators for one resource run side by side", "[fetch_coordinator]") {
    Harness h(40000);

    auto first = h.make({0, 20000});
    auto second = h.make({20000, 20000});
    REQUIRE_FALSE(first->start());
    REQUIRE_FALSE(second->start());
    first->wait();
    second->wait();

    CHECK(first->state() == FetchState::completed);
    CHECK(second->state() == FetchState::completed);
    CHECK(h.completions == 2);
    CHECK(h.cache.is_fully_cached(KEY));

    auto all = h.cache.read_range(KEY, 0, 40000);
    REQUIRE(all.has_value());
    REQUIRE(all->has_value());
    CHECK(**all == h.content());
}

TEST_CASE("FetchState names", "[fetch_coordinator]") {
    CHECK(std::string(to_string(FetchState::partial_then_fetching)) == "partial_then_fetching");
    CHECK(std::string(to_string(FetchState::served_from_cache)) == "served_from_cache");
    CHECK(std::string(to_string(FetchState::cancelled)) == "cancelled");
}
