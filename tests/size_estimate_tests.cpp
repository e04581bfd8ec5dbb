// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <folio/core/size_estimate.hpp>

using namespace folio::core;

namespace {

Canvas sized(std::uint32_t w, std::uint32_t h) {
    Canvas c;
    c.index = 1;
    c.width = w;
    c.height = h;
    return c;
}

} // namespace

TEST_CASE("SizeMultipliers - per format", "[size]") {
    SizeMultipliers m;
    CHECK(m.for_extension("jpeg") == JPEG_BYTES_PER_PIXEL);
    CHECK(m.for_extension("jpg") == JPEG_BYTES_PER_PIXEL);
    CHECK(m.for_extension("png") == PNG_BYTES_PER_PIXEL);
    CHECK(m.for_extension("tif") == TIFF_BYTES_PER_PIXEL);
    CHECK(m.for_extension("tiff") == TIFF_BYTES_PER_PIXEL);
    CHECK(m.for_extension("webp") == JPEG_BYTES_PER_PIXEL);
}

TEST_CASE("estimate_from_dimensions", "[size]") {
    SECTION("Scales with pixel count") {
        auto est = estimate_from_dimensions(sized(2000, 1000), "jpeg");
        REQUIRE(est.has_value());
        CHECK(*est == 900000);
    }

    SECTION("Format matters") {
        auto jpeg = estimate_from_dimensions(sized(1000, 1000), "jpeg");
        auto png = estimate_from_dimensions(sized(1000, 1000), "png");
        REQUIRE(jpeg);
        REQUIRE(png);
        CHECK(*png > *jpeg);
    }

    SECTION("Overridden multipliers") {
        SizeMultipliers m;
        m.jpeg = 1.0;
        CHECK(estimate_from_dimensions(sized(100, 100), "jpeg", m) == 10000u);
    }

    SECTION("Floor for tiny images") {
        CHECK(estimate_from_dimensions(sized(10, 10), "jpeg") == MIN_SIZE_ESTIMATE);
    }

    SECTION("No dimensions") {
        Canvas c;
        CHECK_FALSE(estimate_from_dimensions(c, "jpeg").has_value());
        c.width = 100;
        CHECK_FALSE(estimate_from_dimensions(c, "jpeg").has_value());
    }
}

TEST_CASE("AdaptiveTotal - unknown total", "[size]") {
    AdaptiveTotal total(std::nullopt, SizeSource::head_request);
    CHECK_FALSE(total.known());
    CHECK(total.source() == SizeSource::unknown);
    total.advance(500);
    CHECK(total.received() == 500);
    CHECK_FALSE(total.percent().has_value());
}

TEST_CASE("AdaptiveTotal - exact total", "[size]") {
    AdaptiveTotal total(1000, SizeSource::content_length);
    total.advance(250);
    REQUIRE(total.percent().has_value());
    CHECK(*total.percent() == Catch::Detail::Approx(25.0));

    total.advance(750);
    CHECK(*total.percent() == Catch::Detail::Approx(100.0));
    CHECK(total.total() == 1000u);
}

TEST_CASE("AdaptiveTotal - estimate grows instead of overflowing", "[size]") {
    AdaptiveTotal total(1000, SizeSource::dimension_estimate, 1.25);
    total.advance(1200);
    REQUIRE(total.total().has_value());
    CHECK(*total.total() == 1500);
    CHECK(*total.percent() < 100.0);
    CHECK(total.source() == SizeSource::dimension_estimate);
}

TEST_CASE("AdaptiveTotal - progress never exceeds 100%", "[size]") {
    for (auto source : {SizeSource::content_length, SizeSource::head_request,
                        SizeSource::dimension_estimate}) {
        AdaptiveTotal total(100, source);
        for (int i = 0; i < 50; ++i) {
            total.advance(37);
            REQUIRE(total.percent().has_value());
            CHECK(*total.percent() <= 100.0);
            CHECK(*total.total() >= total.received());
        }
    }
}

TEST_CASE("SizeSource names", "[size]") {
    CHECK(to_string(SizeSource::content_length) == "content-length");
    CHECK(to_string(SizeSource::head_request) == "head");
    CHECK(to_string(SizeSource::dimension_estimate) == "estimate");
    CHECK(to_string(SizeSource::unknown) == "unknown");
}
