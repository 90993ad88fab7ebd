// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <spool/core/error.hpp>
#include <spool/core/url.hpp>

using namespace spool::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/video.mp4");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
        CHECK(result->host() == "example.com");
        CHECK(result->path() == "/video.mp4");
        CHECK(result->is_secure());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://media.example.com:8080/stream");
        REQUIRE(result.has_value());
        CHECK(result->port() == "8080");
        CHECK_FALSE(result->is_secure());
        CHECK(result->base() == "http://media.example.com:8080");
    }

    SECTION("Query and fragment") {
        auto result = Url::parse("https://example.com/video.mp4?quality=hd#t=30");
        REQUIRE(result.has_value());
        CHECK(result->query() == "quality=hd");
        CHECK(result->fragment() == "t=30");
        CHECK(result->full() == "https://example.com/video.mp4?quality=hd#t=30");
    }

    SECTION("No path") {
        auto result = Url::parse("https://example.com");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK(Url::parse("example.com/video.mp4").error() == CacheErrc::invalid_url);
    CHECK(Url::parse("").error() == CacheErrc::invalid_url);
    CHECK(Url::parse("https:///video.mp4").error() == CacheErrc::invalid_url);
}

TEST_CASE("Url::filename", "[url]") {
    CHECK(Url::parse("https://example.com/media/clip.webm")->filename() == "clip.webm");
    CHECK(Url::parse("https://example.com/get.php?id=7")->filename() == "get.php");
    CHECK(Url::parse("https://example.com/media/")->filename() == "index.html");
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
    CHECK(Url::parse("ftp://example.com")->default_port() == 0);
}

TEST_CASE("Url::cache_key identifies the resource", "[url]") {
    auto key = [](std::string_view url) { return Url::parse(url)->cache_key(); };

    CHECK(key("https://example.com/video.mp4") == "https://example.com/video.mp4");
    CHECK(key("HTTPS://Example.COM/video.mp4") == "https://example.com/video.mp4");
    CHECK(key("https://example.com:443/video.mp4") == "https://example.com/video.mp4");
    CHECK(key("https://example.com/video.mp4#t=30") == "https://example.com/video.mp4");

    SECTION("Parts that name a different resource are kept") {
        CHECK(key("https://example.com:8443/video.mp4") == "https://example.com:8443/video.mp4");
        CHECK(key("https://example.com/video.mp4?v=2") == "https://example.com/video.mp4?v=2");
        CHECK(key("https://example.com/Video.mp4") != key("https://example.com/video.mp4"));
        CHECK(key("http://example.com/video.mp4") != key("https://example.com/video.mp4"));
    }
}

TEST_CASE("cache_key_for", "[url]") {
    auto ok = cache_key_for("http://example.com:80/a");
    REQUIRE(ok.has_value());
    CHECK(*ok == "http://example.com/a");

    auto bad = cache_key_for("not a url");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error() == CacheErrc::invalid_url);
}
