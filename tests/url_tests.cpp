// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <folio/core/url.hpp>

using namespace folio::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS manifest URL") {
        auto result = Url::parse("https://iiif.example.org/iiif/book1/manifest.json");
        REQUIRE(result.has_value());
        auto url = *result;
        CHECK(url.scheme() == "https");
        CHECK(url.host() == "iiif.example.org");
        CHECK(url.path() == "/iiif/book1/manifest.json");
        CHECK(url.is_secure());
        CHECK(url.is_http());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8182/iiif/2/abc");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->port() == "8182");
        CHECK(result->base() == "http://example.com:8182");
        CHECK(!result->is_secure());
    }

    SECTION("URL with query and fragment") {
        auto result = Url::parse("https://example.com/manifest.json?v=1#top");
        REQUIRE(result.has_value());
        CHECK(result->query() == "v=1");
        CHECK(result->fragment() == "top");
        CHECK(result->full() == "https://example.com/manifest.json?v=1#top");
    }

    SECTION("IPv6 host") {
        auto result = Url::parse("http://[::1]:8080/manifest");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "8080");
    }

    SECTION("Credentials are not part of the host") {
        auto result = Url::parse("https://user:pw@example.com/m.json");
        REQUIRE(result.has_value());
        CHECK(result->host() == "example.com");
    }

    SECTION("Scheme is case-insensitive") {
        auto result = Url::parse("HTTPS://example.com/");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    SECTION("Missing scheme") {
        auto result = Url::parse("example.com/manifest.json");
        REQUIRE(!result.has_value());
        CHECK(result.error() == make_error_code(DownloadErrc::invalid_url));
    }

    SECTION("Empty string") {
        CHECK(!Url::parse("").has_value());
    }

    SECTION("Empty host") {
        CHECK(!Url::parse("https:///path").has_value());
    }
}

TEST_CASE("Url::filename and stem", "[url]") {
    SECTION("Simple filename") {
        auto result = Url::parse("https://example.com/iiif/manifest.json");
        REQUIRE(result.has_value());
        CHECK(result->filename() == "manifest.json");
        CHECK(result->stem() == "manifest");
    }

    SECTION("Query is not part of the filename") {
        auto result = Url::parse("https://example.com/books/MS-123.json?download=1");
        REQUIRE(result.has_value());
        CHECK(result->filename() == "MS-123.json");
        CHECK(result->stem() == "MS-123");
    }

    SECTION("Path without filename") {
        auto result = Url::parse("https://example.com/folder/");
        REQUIRE(result.has_value());
        CHECK(result->filename().empty());
    }

    SECTION("No extension") {
        auto result = Url::parse("https://example.com/iiif/book1");
        REQUIRE(result.has_value());
        CHECK(result->stem() == "book1");
    }
}

TEST_CASE("Url::default_port", "[url]") {
    CHECK(Url::parse("https://example.com")->default_port() == 443);
    CHECK(Url::parse("http://example.com")->default_port() == 80);
    CHECK(Url::parse("ftp://example.com")->default_port() == 0);
}

TEST_CASE("looks_like_http_url", "[url]") {
    CHECK(looks_like_http_url("https://example.com/m.json"));
    CHECK(looks_like_http_url("HTTP://example.com/m.json"));
    CHECK_FALSE(looks_like_http_url("manifest.json"));
    CHECK_FALSE(looks_like_http_url("/tmp/https/manifest.json"));
    CHECK_FALSE(looks_like_http_url("ftp://example.com"));
}
