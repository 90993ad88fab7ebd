// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/error.hpp>
#include <spool/core/metadata_store.hpp>
#include <spool/disk/error.hpp>
#include <filesystem>
#include <random>

using namespace spool::core;
namespace fs = std::filesystem;

namespace {

PersistedRecord record_for(std::string key, std::uint64_t revision, std::uint64_t cached) {
    PersistedRecord rec;
    rec.key = std::move(key);
    rec.revision = revision;
    rec.metadata.content_length = 1000;
    if (cached > 0) {
        rec.ranges = {{0, cached}};
        rec.chunks = {{0, cached}};
    }
    return rec;
}

// Scratch directory removed on scope exit
struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("spool-test-" + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

} // namespace

TEST_CASE("MetadataStore persists in the background", "[metadata_store]") {
    MemoryMetadataBackend backend;
    MetadataStore store(backend);

    store.persist(record_for("a", 1, 100));
    store.sync();

    auto doc = backend.load("a");
    REQUIRE(doc.has_value());
    auto rec = PersistedRecord::from_json(*doc);
    REQUIRE(rec.has_value());
    CHECK(rec->revision == 1);
    CHECK(rec->ranges == std::vector<CachedRange>{{0, 100}});
}

TEST_CASE("MetadataStore::load", "[metadata_store]") {
    MemoryMetadataBackend backend;
    MetadataStore store(backend);

    SECTION("Nothing stored is not an error") {
        auto rec = store.load("missing");
        REQUIRE(rec.has_value());
        CHECK_FALSE(rec->has_value());
    }

    SECTION("Durable copy") {
        backend.put_raw("a", record_for("a", 3, 200).to_json());
        auto rec = store.load("a");
        REQUIRE(rec.has_value());
        REQUIRE(rec->has_value());
        CHECK((*rec)->revision == 3);
    }

    SECTION("Corrupt document") {
        backend.put_raw("a", "{\"version\": 1");
        auto rec = store.load("a");
        REQUIRE_FALSE(rec.has_value());
        CHECK(rec.error() == CacheErrc::cache_corruption);
    }

    SECTION("Document stored under another key") {
        backend.put_raw("a", record_for("b", 1, 0).to_json());
        auto rec = store.load("a");
        REQUIRE_FALSE(rec.has_value());
        CHECK(rec.error() == CacheErrc::cache_corruption);
    }
}

TEST_CASE("MetadataStore drops snapshots older than one already accepted", "[metadata_store]") {
    MemoryMetadataBackend backend;
    MetadataStore store(backend);

    store.persist(record_for("a", 5, 500));
    store.persist(record_for("a", 4, 400));
    store.persist(record_for("a", 5, 300));
    store.sync();

    auto rec = store.load("a");
    REQUIRE(rec.has_value());
    REQUIRE(rec->has_value());
    CHECK((*rec)->revision == 5);
    CHECK((*rec)->ranges == std::vector<CachedRange>{{0, 500}});
}

TEST_CASE("MetadataStore coalesces queued snapshots", "[metadata_store]") {
    MemoryMetadataBackend backend;
    MetadataStore store(backend);

    for (std::uint64_t rev = 1; rev <= 50; ++rev) {
        store.persist(record_for("a", rev, rev * 10));
    }
    store.sync();

    CHECK(backend.save_count() <= 50);
    auto rec = store.load("a");
    REQUIRE(rec.has_value());
    REQUIRE(rec->has_value());
    CHECK((*rec)->revision == 50);
}

TEST_CASE("MetadataStore::remove", "[metadata_store]") {
    MemoryMetadataBackend backend;
    MetadataStore store(backend);

    store.persist(record_for("a", 1, 100));
    store.persist(record_for("b", 1, 100));
    store.sync();

    REQUIRE_FALSE(store.remove("a"));
    auto a = store.load("a");
    REQUIRE(a.has_value());
    CHECK_FALSE(a->has_value());

    SECTION("A fresh record starts over at a low revision") {
        store.persist(record_for("a", 1, 50));
        store.sync();
        auto again = store.load("a");
        REQUIRE(again.has_value());
        REQUIRE(again->has_value());
        CHECK((*again)->ranges == std::vector<CachedRange>{{0, 50}});
    }

    SECTION("remove_all") {
        REQUIRE_FALSE(store.remove_all());
        auto b = store.load("b");
        REQUIRE(b.has_value());
        CHECK_FALSE(b->has_value());
    }
}

TEST_CASE("MetadataStore flushes on destruction", "[metadata_store]") {
    MemoryMetadataBackend backend;
    {
        MetadataStore store(backend);
        store.persist(record_for("a", 1, 100));
    }
    CHECK(backend.load("a").has_value());
}

TEST_CASE("FileMetadataBackend", "[metadata_store][filesystem]") {
    TempDir dir;
    auto backend = FileMetadataBackend::open((dir.path / "cache").string());
    REQUIRE(backend.has_value());

    const std::string key = "https://example.com/video.mp4";
    auto missing = (*backend)->load(key);
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error() == spool::disk::DiskErrc::file_not_found);

    REQUIRE_FALSE((*backend)->save(key, "first"));
    REQUIRE_FALSE((*backend)->save(key, "second"));
    CHECK((*backend)->load(key) == std::string("second"));

    auto path = fs::path((*backend)->path_for(key));
    CHECK(path.filename().string().ends_with(".meta.json"));
    CHECK(fs::exists(path));
    CHECK_FALSE(fs::exists(path.string() + ".tmp"));

    REQUIRE_FALSE((*backend)->save("other", "x"));
    REQUIRE_FALSE((*backend)->remove(key));
    CHECK_FALSE(fs::exists(path));
    CHECK((*backend)->load("other").has_value());

    REQUIRE_FALSE((*backend)->remove_all());
    CHECK_FALSE((*backend)->load("other").has_value());
}
