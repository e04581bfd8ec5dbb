// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch.hpp>
#include <folio/core/config.hpp>
#include <folio/core/file_tracker.hpp>
#include <nlohmann/json.hpp>
#include "test_support.hpp"

using namespace folio::core;
using folio::test::TempDir;
using folio::test::write_file;
using folio::test::read_file;
namespace fs = std::filesystem;

namespace {

Canvas canvas(std::uint32_t index, std::optional<std::string> label = std::nullopt) {
    Canvas c;
    c.index = index;
    c.url = "https://example.org/iiif/p" + std::to_string(index) + "/full/max/0/default.jpeg";
    c.label = std::move(label);
    return c;
}

} // namespace

TEST_CASE("FileTracker - empty directory", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());

    CHECK_FALSE(tracker.load());
    CHECK(tracker.completed_count() == 0);
    CHECK(tracker.detect(canvas(1), "jpeg").scheme == FileScheme::missing);
    CHECK_FALSE(tracker.is_complete(canvas(1), "jpeg"));
    CHECK(tracker.ledger_path() == dir.path() / LEDGER_FILENAME);
}

TEST_CASE("FileTracker - detection by naming scheme", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());

    SECTION("Current hybrid name") {
        write_file(dir / "canvas-002_Page_5.jpeg", "data");
        auto d = tracker.detect(canvas(2, "Page 5"), "jpeg");
        CHECK(d.scheme == FileScheme::current);
        CHECK(d.filename == "canvas-002_Page_5.jpeg");
    }

    SECTION("Legacy name for a labelled canvas") {
        write_file(dir / "image_002.jpeg", "data");
        auto d = tracker.detect(canvas(2, "folio003r"), "jpeg");
        CHECK(d.scheme == FileScheme::legacy);
        CHECK(d.filename == "image_002.jpeg");
    }

    SECTION("Plain name is current for an unlabelled canvas") {
        write_file(dir / "image_001.jpeg", "data");
        auto d = tracker.detect(canvas(1), "jpeg");
        CHECK(d.scheme == FileScheme::current);
        CHECK(d.filename == "image_001.jpeg");
    }

    SECTION("Other known extensions are found") {
        write_file(dir / "image_003.png", "data");
        auto d = tracker.detect(canvas(3), "jpeg");
        CHECK(d.scheme == FileScheme::current);
        CHECK(d.filename == "image_003.png");
    }

    SECTION("Current name wins over legacy") {
        write_file(dir / "image_004.jpeg", "old");
        write_file(dir / "canvas-004_Recto.jpeg", "new");
        auto d = tracker.detect(canvas(4, "Recto"), "jpeg");
        CHECK(d.scheme == FileScheme::current);
        CHECK(d.filename == "canvas-004_Recto.jpeg");
    }

    SECTION("Zero-byte file counts as missing") {
        write_file(dir / "image_005.jpeg", "");
        CHECK(tracker.detect(canvas(5), "jpeg").scheme == FileScheme::missing);
    }

    SECTION("Temporary files are ignored") {
        write_file(dir / ".image_006.jpeg.part", "partial");
        CHECK(tracker.detect(canvas(6), "jpeg").scheme == FileScheme::missing);
    }
}

TEST_CASE("FileTracker - ledger survives a new instance", "[tracker]") {
    TempDir dir;
    {
        FileTracker tracker(dir.path());
        REQUIRE_FALSE(tracker.load());
        write_file(dir / "image_001.jpeg", "abcd");
        write_file(dir / "canvas-002_Page_5.png", "efghij");
        CHECK_FALSE(tracker.record_complete(canvas(1), "image_001.jpeg", 4));
        CHECK_FALSE(tracker.record_complete(canvas(2, "Page 5"), "canvas-002_Page_5.png", 6));
        CHECK(tracker.persistent());
    }

    auto doc = nlohmann::json::parse(read_file(dir / std::string(LEDGER_FILENAME)));
    REQUIRE(doc.contains("1"));
    CHECK(doc["1"]["filename"] == "image_001.jpeg");
    CHECK(doc["1"]["sizeBytes"] == 4);
    CHECK(doc["2"]["completedAt"].get<std::string>().ends_with("Z"));

    FileTracker reloaded(dir.path());
    REQUIRE_FALSE(reloaded.load());
    CHECK(reloaded.completed_count() == 2);
    REQUIRE(reloaded.entry(2) != nullptr);
    CHECK(reloaded.entry(2)->filename == "canvas-002_Page_5.png");
    CHECK(reloaded.entry(2)->size_bytes == 6);

    // The ledger names a png even though jpeg is preferred
    auto d = reloaded.detect(canvas(2, "Page 5"), "jpeg");
    CHECK(d.scheme == FileScheme::current);
    CHECK(d.filename == "canvas-002_Page_5.png");
}

TEST_CASE("FileTracker - stale entries are pruned on load", "[tracker]") {
    TempDir dir;
    {
        FileTracker tracker(dir.path());
        write_file(dir / "image_001.jpeg", "abcd");
        write_file(dir / "image_002.jpeg", "abcd");
        REQUIRE_FALSE(tracker.record_complete(canvas(1), "image_001.jpeg", 4));
        REQUIRE_FALSE(tracker.record_complete(canvas(2), "image_002.jpeg", 4));
    }
    fs::remove(dir / "image_002.jpeg");

    FileTracker tracker(dir.path());
    REQUIRE_FALSE(tracker.load());
    CHECK(tracker.completed_count() == 1);
    CHECK(tracker.entry(1) != nullptr);
    CHECK(tracker.entry(2) == nullptr);
    CHECK_FALSE(tracker.is_complete(canvas(2), "jpeg"));
}

TEST_CASE("FileTracker - malformed ledger", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());

    SECTION("Not JSON") {
        write_file(dir / std::string(LEDGER_FILENAME), "{ not json");
        CHECK(tracker.load() == DownloadErrc::ledger_io);
        CHECK(tracker.completed_count() == 0);
    }

    SECTION("Unknown keys and fields are ignored") {
        write_file(dir / "image_003.jpeg", "abc");
        write_file(dir / std::string(LEDGER_FILENAME),
                   R"({"version": 2, "abc": {}, "0": {"filename": "image_003.jpeg"},)"
                   R"( "3": {"filename": "image_003.jpeg", "sizeBytes": 3, "extra": true}})");
        CHECK_FALSE(tracker.load());
        CHECK(tracker.completed_count() == 1);
        REQUIRE(tracker.entry(3) != nullptr);
        CHECK(tracker.entry(3)->size_bytes == 3);
    }
}

TEST_CASE("FileTracker - record_complete overwrites", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());
    write_file(dir / "image_001.jpeg", "abcd");
    write_file(dir / "image_001.png", "abcdefgh");

    REQUIRE_FALSE(tracker.record_complete(canvas(1), "image_001.jpeg", 4));
    REQUIRE_FALSE(tracker.record_complete(canvas(1), "image_001.png", 8));
    CHECK(tracker.completed_count() == 1);
    CHECK(tracker.entry(1)->filename == "image_001.png");
}

TEST_CASE("FileTracker - ledger write failure degrades to memory", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());

    // The ledger's temporary name is occupied by a directory
    auto blocker = dir.path() / LEDGER_FILENAME;
    blocker += ".tmp";
    fs::create_directory(blocker);

    write_file(dir / "image_001.jpeg", "abcd");
    write_file(dir / "image_002.jpeg", "abcd");

    CHECK(tracker.record_complete(canvas(1), "image_001.jpeg", 4) == DownloadErrc::ledger_io);
    CHECK_FALSE(tracker.persistent());
    // Warned once, quiet afterwards
    CHECK_FALSE(tracker.record_complete(canvas(2), "image_002.jpeg", 4));

    CHECK(tracker.completed_count() == 2);
    CHECK(tracker.is_complete(canvas(2), "jpeg"));
    CHECK_FALSE(fs::exists(dir / std::string(LEDGER_FILENAME)));
}

TEST_CASE("FileTracker - migration", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());
    auto labelled = canvas(2, "folio003r");

    SECTION("Legacy file is renamed") {
        write_file(dir / "image_002.jpeg", "pixels");
        auto moved = tracker.migrate(labelled, "jpeg");
        REQUIRE(moved.has_value());
        CHECK(*moved == "canvas-002_folio003r.jpeg");
        CHECK(fs::exists(dir / "canvas-002_folio003r.jpeg"));
        CHECK_FALSE(fs::exists(dir / "image_002.jpeg"));
        CHECK(read_file(dir / "canvas-002_folio003r.jpeg") == "pixels");
    }

    SECTION("Idempotent") {
        write_file(dir / "image_002.jpeg", "pixels");
        REQUIRE(tracker.migrate(labelled, "jpeg").has_value());
        auto again = tracker.migrate(labelled, "jpeg");
        REQUIRE(again.has_value());
        CHECK(*again == "canvas-002_folio003r.jpeg");
        CHECK(folio::test::list_files(dir.path()) ==
              std::vector<std::string>{"canvas-002_folio003r.jpeg"});
    }

    SECTION("Extension is preserved") {
        write_file(dir / "image_002.png", "pixels");
        auto moved = tracker.migrate(labelled, "jpeg");
        REQUIRE(moved.has_value());
        CHECK(*moved == "canvas-002_folio003r.png");
    }

    SECTION("Identical destination drops the duplicate") {
        write_file(dir / "image_002.jpeg", "pixels");
        write_file(dir / "canvas-002_folio003r.jpeg", "pixels");
        auto moved = tracker.migrate(labelled, "jpeg");
        REQUIRE(moved.has_value());
        CHECK_FALSE(fs::exists(dir / "image_002.jpeg"));
    }

    SECTION("Conflicting destination is left alone") {
        write_file(dir / "image_002.jpeg", "pixels");
        write_file(dir / "canvas-002_folio003r.jpeg", "different pixels");
        auto moved = tracker.migrate(labelled, "jpeg");
        REQUIRE_FALSE(moved.has_value());
        CHECK(moved.error() == DownloadErrc::migration_conflict);
        CHECK(fs::exists(dir / "image_002.jpeg"));
        CHECK(read_file(dir / "canvas-002_folio003r.jpeg") == "different pixels");
    }

    SECTION("Nothing on disk") {
        auto moved = tracker.migrate(labelled, "jpeg");
        CHECK_FALSE(moved.has_value());
    }

    SECTION("Ledger entry follows the rename") {
        write_file(dir / "image_002.jpeg", "pixels");
        REQUIRE_FALSE(tracker.record_complete(labelled, "image_002.jpeg", 6));
        REQUIRE(tracker.migrate(labelled, "jpeg").has_value());
        CHECK(tracker.entry(2)->filename == "canvas-002_folio003r.jpeg");

        FileTracker reloaded(dir.path());
        REQUIRE_FALSE(reloaded.load());
        REQUIRE(reloaded.entry(2) != nullptr);
        CHECK(reloaded.entry(2)->filename == "canvas-002_folio003r.jpeg");
    }
}

TEST_CASE("FileTracker - legacy duplicate beside the current name", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());
    auto labelled = canvas(4, "folio 7v");

    CHECK(tracker.find_legacy(labelled, "jpeg").empty());

    write_file(dir / "canvas-004_folio_7v.jpeg", "pixels");
    write_file(dir / "image_004.jpeg", "pixels");

    // detect reports the current name, find_legacy still sees the leftover
    CHECK(tracker.detect(labelled, "jpeg").scheme == FileScheme::current);
    CHECK(tracker.find_legacy(labelled, "jpeg") == "image_004.jpeg");

    auto migrated = tracker.migrate(labelled, "jpeg");
    REQUIRE(migrated);
    CHECK(*migrated == "canvas-004_folio_7v.jpeg");
    CHECK_FALSE(fs::exists(dir / "image_004.jpeg"));
    CHECK(tracker.find_legacy(labelled, "jpeg").empty());

    // Unlabelled canvases have no legacy name
    write_file(dir / "image_005.jpeg", "pixels");
    CHECK(tracker.find_legacy(canvas(5), "jpeg").empty());
}

TEST_CASE("FileTracker - every served format is found without a ledger", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());

    write_file(dir / "image_001.gif", "GIF89a");
    write_file(dir / "image_002.webp", "RIFF");

    auto found = tracker.detect(canvas(1), "jpeg");
    CHECK(found.scheme == FileScheme::current);
    CHECK(found.filename == "image_001.gif");
    CHECK(tracker.detect(canvas(2), "jpeg").filename == "image_002.webp");

    write_file(dir / "image_003.gif", "GIF89a");
    auto legacy = tracker.detect(canvas(3, "Plate"), "jpeg");
    CHECK(legacy.scheme == FileScheme::legacy);
    CHECK(legacy.filename == "image_003.gif");
}

TEST_CASE("FileTracker - reset forgets everything", "[tracker]") {
    TempDir dir;
    FileTracker tracker(dir.path());
    write_file(dir / "image_001.jpeg", "abcd");
    REQUIRE_FALSE(tracker.record_complete(canvas(1), "image_001.jpeg", 4));
    REQUIRE(fs::exists(tracker.ledger_path()));

    CHECK_FALSE(tracker.reset());
    CHECK(tracker.completed_count() == 0);
    CHECK_FALSE(fs::exists(tracker.ledger_path()));
    // Files on disk are untouched
    CHECK(fs::exists(dir / "image_001.jpeg"));
}
