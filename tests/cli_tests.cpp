// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <folio/cli/commands.hpp>
#include <folio/cli/progress_bar.hpp>
#include <string>
#include <vector>

using namespace folio::cli;
using folio::core::RateMode;

namespace {

// argv with writable storage
class Argv {
public:
    Argv(std::initializer_list<std::string> args) : storage_(args) {
        for (auto& s : storage_) {
            pointers_.push_back(s.data());
        }
        pointers_.push_back(nullptr);
    }
    [[nodiscard]] int argc() const { return static_cast<int>(storage_.size()); }
    [[nodiscard]] char** argv() { return pointers_.data(); }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

CliArgs parse(std::initializer_list<std::string> args) {
    Argv a(args);
    return parse_args(a.argc(), a.argv());
}

} // namespace

TEST_CASE("parse_args - defaults", "[cli]") {
    auto args = parse({"folio", "manifest.json"});
    CHECK(args.error.empty());
    CHECK(args.manifest == "manifest.json");
    CHECK(args.output_dir.empty());
    CHECK_FALSE(args.resume);
    CHECK_FALSE(args.list_only);
    CHECK_FALSE(args.canvas.has_value());
    CHECK_FALSE(args.width.has_value());
}

TEST_CASE("parse_args - options", "[cli]") {
    auto args = parse({"folio", "-o", "out", "--resume", "-c", "3", "--size", "1200",
                       "--retries", "5", "-V", "https://example.org/iiif/m.json"});
    CHECK(args.error.empty());
    CHECK(args.output_dir == "out");
    CHECK(args.resume);
    CHECK(args.canvas == 3u);
    CHECK(args.width == 1200u);
    CHECK(args.retries == 5u);
    CHECK(args.verbose);
    CHECK(args.manifest == "https://example.org/iiif/m.json");
}

TEST_CASE("parse_args - help and version stop parsing", "[cli]") {
    CHECK(parse({"folio", "--help", "--bogus"}).help);
    CHECK(parse({"folio", "-v"}).version);
}

TEST_CASE("parse_args - errors", "[cli]") {
    CHECK_FALSE(parse({"folio", "--bogus"}).error.empty());
    CHECK_FALSE(parse({"folio", "m.json", "-o"}).error.empty());
    CHECK_FALSE(parse({"folio", "m.json", "-c", "two"}).error.empty());
    CHECK_FALSE(parse({"folio", "m.json", "-c", "-1"}).error.empty());
    CHECK_FALSE(parse({"folio", "m.json", "--size", "0"}).error.empty());
    CHECK_FALSE(parse({"folio", "m.json", "--delay", "-2"}).error.empty());
    CHECK_FALSE(parse({"folio", "a.json", "b.json"}).error.empty());
    CHECK_FALSE(parse({"folio", "m.json", "--rate-limit", "30", "--delay", "1"}).error.empty());
}

TEST_CASE("parse_args - canvas range is left to the engine", "[cli]") {
    auto args = parse({"folio", "m.json", "-c", "0"});
    CHECK(args.error.empty());
    CHECK(args.canvas == 0u);
}

TEST_CASE("engine_options", "[cli]") {
    SECTION("Defaults") {
        auto opts = engine_options(parse({"folio", "https://example.org/iiif/MS-7.json"}));
        CHECK(opts.output_dir == "MS-7");
        CHECK_FALSE(opts.resume);
        CHECK(opts.rate.mode == RateMode::adaptive);
        CHECK(opts.retry.max_attempts == folio::core::RETRY_COUNT + 1);
    }

    SECTION("Explicit values") {
        auto opts = engine_options(parse({"folio", "m.json", "-o", "pages", "-r", "-c", "2",
                                          "--retries", "0", "--rate-limit", "30"}));
        CHECK(opts.output_dir == "pages");
        CHECK(opts.resume);
        CHECK(opts.single_canvas == 2u);
        CHECK(opts.retry.max_attempts == 1);
        CHECK(opts.rate.mode == RateMode::fixed_rpm);
    }

    SECTION("Fixed delay") {
        auto opts = engine_options(parse({"folio", "m.json", "--delay", "1.5"}));
        CHECK(opts.rate.mode == RateMode::fixed_delay);
    }
}

TEST_CASE("ProgressBar::format_bytes", "[cli]") {
    CHECK(ProgressBar::format_bytes(0) == "0 B");
    CHECK(ProgressBar::format_bytes(512) == "512 B");
    CHECK(ProgressBar::format_bytes(2048) == "2 KB");
    CHECK(ProgressBar::format_bytes(5 * 1024 * 1024 + 512 * 1024) == "5.5 MB");
    CHECK(ProgressBar::format_bytes(3ULL * 1024 * 1024 * 1024) == "3.00 GB");
}

TEST_CASE("ProgressBar::format_time", "[cli]") {
    CHECK(ProgressBar::format_time(0) == "0s");
    CHECK(ProgressBar::format_time(59) == "59s");
    CHECK(ProgressBar::format_time(61) == "1m 1s");
    CHECK(ProgressBar::format_time(3725) == "1h 2m");
}

TEST_CASE("ProgressBar - label resets state", "[cli]") {
    ProgressBar bar("[1/3] image_001.jpeg");
    CHECK(bar.label() == "[1/3] image_001.jpeg");
    CHECK_FALSE(bar.active());
    bar.label("[2/3] image_002.jpeg");
    CHECK(bar.label() == "[2/3] image_002.jpeg");
    CHECK_FALSE(bar.active());
}
