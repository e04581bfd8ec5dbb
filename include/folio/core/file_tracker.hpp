// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/canvas.hpp>
#include <folio/core/error.hpp>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <unordered_map>

namespace folio::core {

// Which naming scheme an existing file was found under
enum class FileScheme : std::uint8_t {
    missing,
    current,   // canvas-NNN_label.ext, or image_NNN.ext for unlabelled canvases
    legacy     // image_NNN.ext for a canvas that now has a label
};

struct Detection {
    FileScheme scheme{FileScheme::missing};
    std::string filename;   // Name found on disk, empty when missing
};

// One persisted ledger record
struct LedgerEntry {
    std::string filename;
    std::uint64_t size_bytes{0};
    std::string completed_at;   // ISO 8601, UTC
};

// Resume ledger for one output directory. Lookups are keyed by canvas
// index. Every mutation rewrites the ledger through a temporary file and
// an atomic rename. If that ever fails the tracker keeps working in
// memory for the rest of the run.
class FileTracker {
public:
    explicit FileTracker(std::filesystem::path output_dir);

    // Read the persisted ledger, dropping entries whose file is gone.
    // A missing ledger is not an error; an unreadable one yields ledger_io
    // and leaves the tracker empty.
    [[nodiscard]] std::error_code load() noexcept;

    // Pure query: look for the canvas on disk under the current scheme
    // first, then under the legacy scheme. preferred_ext is tried before
    // the other known extensions.
    [[nodiscard]] Detection detect(const Canvas& canvas,
                                   std::string_view preferred_ext) const noexcept;

    // Legacy-named file of a labelled canvas still on disk, empty when none.
    // Looks past the current name, so it also finds a leftover duplicate.
    [[nodiscard]] std::string find_legacy(const Canvas& canvas,
                                          std::string_view preferred_ext) const noexcept;

    // True when detect() finds the canvas under either scheme
    [[nodiscard]] bool is_complete(const Canvas& canvas,
                                   std::string_view preferred_ext) const noexcept;

    // Rename a legacy-named file to the current scheme and return the new
    // name. Idempotent. Fails with migration_conflict when the destination
    // exists with a different size, file_not_found when nothing is on disk.
    [[nodiscard]] std::expected<std::string, std::error_code>
    migrate(const Canvas& canvas, std::string_view preferred_ext) noexcept;

    // Add or overwrite the entry and persist the ledger
    [[nodiscard]] std::error_code record_complete(const Canvas& canvas,
                                                  const std::string& filename,
                                                  std::uint64_t size_bytes) noexcept;

    // Forget everything, in memory and on disk
    [[nodiscard]] std::error_code reset() noexcept;

    [[nodiscard]] const LedgerEntry* entry(std::uint32_t index) const noexcept;
    [[nodiscard]] std::size_t completed_count() const noexcept { return entries_.size(); }
    [[nodiscard]] bool persistent() const noexcept { return persistent_; }
    [[nodiscard]] const std::filesystem::path& output_dir() const noexcept { return output_dir_; }
    [[nodiscard]] const std::filesystem::path& ledger_path() const noexcept { return ledger_path_; }

private:
    [[nodiscard]] std::error_code persist() noexcept;
    [[nodiscard]] bool present(const std::string& filename) const noexcept;

    std::filesystem::path output_dir_;
    std::filesystem::path ledger_path_;
    std::unordered_map<std::uint32_t, LedgerEntry> entries_;
    bool persistent_{true};
};

} // namespace folio::core
