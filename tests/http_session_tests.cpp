// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <folio/core/config.hpp>
#include <folio/core/http_session.hpp>
#include "test_support.hpp"
#include <stdexcept>

using namespace folio::core;
using folio::test::TempDir;
using folio::test::write_file;

// Image servers routinely redirect to a CDN
static_assert(FOLLOW_REDIRECTS);
static_assert(MAX_REDIRECTS > 0);

namespace {

std::string file_url(const std::filesystem::path& path) {
    return "file://" + path.string();
}

} // namespace

TEST_CASE("HttpSession - options", "[http]") {
    HttpSession session;
    CHECK(session.options().connect_timeout_sec == CONNECTION_TIMEOUT_SEC);
    CHECK(session.options().stall_timeout_sec == STALL_TIMEOUT_SEC);
    CHECK(session.options().user_agent == USER_AGENT);
}

TEST_CASE("HttpSession - unsupported scheme", "[http]") {
    HttpSession session;
    auto resp = session.get("nosuch://example.org/x.jpeg", {}, {});
    REQUIRE_FALSE(resp.has_value());
    CHECK(resp.error() == DownloadErrc::invalid_url);
}

TEST_CASE("HttpSession - a throwing callback becomes a typed error", "[http]") {
    TempDir dir;
    HttpSession session;
    HeadersCallback throwing = [](const HttpResponse&) { throw std::runtime_error("observer failed"); };

    SECTION("With a body") {
        write_file(dir / "page.jpeg", "pixels");
        auto resp = session.get(file_url(dir / "page.jpeg"), throwing, {});
        REQUIRE_FALSE(resp.has_value());
        CHECK(resp.error() == DownloadErrc::callback_failed);
    }

    SECTION("Empty body") {
        write_file(dir / "empty.jpeg", "");
        auto resp = session.get(file_url(dir / "empty.jpeg"), throwing, {});
        REQUIRE_FALSE(resp.has_value());
        CHECK(resp.error() == DownloadErrc::callback_failed);
    }

    SECTION("Session stays usable afterwards") {
        write_file(dir / "page.jpeg", "pixels");
        (void)session.get(file_url(dir / "page.jpeg"), throwing, {});

        bool saw_headers = false;
        auto resp = session.get(file_url(dir / "page.jpeg"),
                                [&](const HttpResponse&) { saw_headers = true; }, {});
        CHECK(resp.has_value());
        CHECK(saw_headers);
    }
}
