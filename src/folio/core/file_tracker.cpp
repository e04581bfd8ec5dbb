// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/file_tracker.hpp>
#include <folio/core/config.hpp>
#include <folio/core/naming.hpp>
#include <folio/disk/error.hpp>
#include <folio/disk/file_writer.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <ctime>
#include <exception>
#include <fstream>
#include <sstream>
#include <vector>

namespace folio::core {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> candidate_extensions(std::string_view preferred) {
    std::vector<std::string> exts;
    exts.reserve(KNOWN_EXTENSIONS.size() + 1);
    if (!preferred.empty()) {
        exts.emplace_back(preferred);
    }
    for (auto ext : KNOWN_EXTENSIONS) {
        if (ext != preferred) {
            exts.emplace_back(ext);
        }
    }
    return exts;
}

std::string utc_timestamp() {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    gmtime_r(&now, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

std::uint64_t size_on_disk(const fs::path& p) noexcept {
    std::error_code ec;
    auto size = fs::file_size(p, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

} // namespace

FileTracker::FileTracker(fs::path output_dir)
    : output_dir_(std::move(output_dir))
    , ledger_path_(output_dir_ / LEDGER_FILENAME) {}

bool FileTracker::present(const std::string& filename) const noexcept {
    if (filename.empty()) return false;
    std::error_code ec;
    auto path = output_dir_ / filename;
    // Zero-byte files are never produced by a completed transfer
    return fs::is_regular_file(path, ec) && size_on_disk(path) > 0;
}

std::error_code FileTracker::load() noexcept {
    entries_.clear();

    std::error_code exists_ec;
    if (!fs::exists(ledger_path_, exists_ec)) {
        return {};
    }

    try {
        std::ifstream in(ledger_path_, std::ios::binary);
        if (!in) {
            return make_error_code(DownloadErrc::ledger_io);
        }
        std::stringstream buffer;
        buffer << in.rdbuf();

        auto doc = nlohmann::json::parse(buffer.str(), nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            return make_error_code(DownloadErrc::ledger_io);
        }

        std::size_t stale = 0;
        for (const auto& [key, value] : doc.items()) {
            // Unknown keys and fields are ignored
            std::uint32_t index = 0;
            try {
                std::size_t consumed = 0;
                auto parsed = std::stoul(key, &consumed);
                if (consumed != key.size() || parsed == 0) continue;
                index = static_cast<std::uint32_t>(parsed);
            } catch (const std::exception&) {
                continue;
            }
            if (!value.is_object()) continue;

            LedgerEntry entry;
            entry.filename = value.value("filename", std::string{});
            entry.size_bytes = value.value("sizeBytes", std::uint64_t{0});
            entry.completed_at = value.value("completedAt", std::string{});

            if (!present(entry.filename)) {
                ++stale;
                continue;
            }
            entries_[index] = std::move(entry);
        }

        if (stale > 0) {
            spdlog::warn("Dropped {} stale ledger entr{} (file missing on disk)",
                         stale, stale == 1 ? "y" : "ies");
        }
        spdlog::debug("Loaded {} ledger entries from {}", entries_.size(), ledger_path_.string());
        return {};
    } catch (const std::exception& e) {
        spdlog::debug("Ledger parse failed: {}", e.what());
        entries_.clear();
        return make_error_code(DownloadErrc::ledger_io);
    }
}

Detection FileTracker::detect(const Canvas& canvas, std::string_view preferred_ext) const noexcept {
    try {
        // Ledger first: it may name a file with an extension we would not guess
        if (const auto* recorded = entry(canvas.index); recorded && present(recorded->filename)) {
            bool is_legacy_name = canvas.has_label()
                && recorded->filename.starts_with(legacy_filename(canvas.index, ""));
            return {is_legacy_name ? FileScheme::legacy : FileScheme::current, recorded->filename};
        }

        for (const auto& ext : candidate_extensions(preferred_ext)) {
            auto name = canvas_filename(canvas, ext);
            if (present(name)) {
                return {FileScheme::current, name};
            }
        }

        if (auto legacy = find_legacy(canvas, preferred_ext); !legacy.empty()) {
            return {FileScheme::legacy, std::move(legacy)};
        }
    } catch (const std::exception& e) {
        spdlog::debug("detect failed for canvas {}: {}", canvas.index, e.what());
    }
    return {};
}

std::string FileTracker::find_legacy(const Canvas& canvas, std::string_view preferred_ext) const noexcept {
    if (!canvas.has_label()) {
        return {};
    }
    try {
        for (const auto& ext : candidate_extensions(preferred_ext)) {
            auto name = legacy_filename(canvas.index, ext);
            if (present(name)) {
                return name;
            }
        }
    } catch (const std::exception& e) {
        spdlog::debug("find_legacy failed for canvas {}: {}", canvas.index, e.what());
    }
    return {};
}

bool FileTracker::is_complete(const Canvas& canvas, std::string_view preferred_ext) const noexcept {
    return detect(canvas, preferred_ext).scheme != FileScheme::missing;
}

std::expected<std::string, std::error_code>
FileTracker::migrate(const Canvas& canvas, std::string_view preferred_ext) noexcept {
    try {
        auto legacy_name = find_legacy(canvas, preferred_ext);
        if (legacy_name.empty()) {
            // Already migrated, or never a legacy canvas
            auto found = detect(canvas, preferred_ext);
            if (found.scheme == FileScheme::current) {
                return found.filename;
            }
            return std::unexpected(disk::make_error_code(disk::DiskErrc::file_not_found));
        }

        auto legacy_ext = legacy_name.substr(legacy_name.rfind('.') + 1);
        auto target_name = canvas_filename(canvas, legacy_ext);
        auto source = output_dir_ / legacy_name;
        auto target = output_dir_ / target_name;

        if (present(target_name)) {
            if (size_on_disk(source) != size_on_disk(target)) {
                spdlog::warn("Cannot migrate {} -> {}: destination differs", legacy_name, target_name);
                return std::unexpected(make_error_code(DownloadErrc::migration_conflict));
            }
            // Same content already in place, drop the duplicate
            std::error_code rm_ec;
            fs::remove(source, rm_ec);
            if (rm_ec) {
                return std::unexpected(rm_ec);
            }
        } else {
            std::error_code mv_ec;
            fs::rename(source, target, mv_ec);
            if (mv_ec) {
                return std::unexpected(mv_ec);
            }
        }

        spdlog::info("Migrated {} -> {}", legacy_name, target_name);

        if (auto it = entries_.find(canvas.index); it != entries_.end()) {
            it->second.filename = target_name;
            if (persistent_) {
                if (auto ec = persist()) {
                    persistent_ = false;
                    spdlog::warn("Cannot write resume ledger {}: {}; tracking in memory only",
                                 ledger_path_.string(), ec.message());
                }
            }
        }

        return target_name;
    } catch (const std::exception& e) {
        spdlog::debug("migrate failed for canvas {}: {}", canvas.index, e.what());
        return std::unexpected(disk::make_error_code(disk::DiskErrc::rename_error));
    }
}

std::error_code FileTracker::record_complete(const Canvas& canvas,
                                             const std::string& filename,
                                             std::uint64_t size_bytes) noexcept {
    try {
        entries_[canvas.index] = LedgerEntry{filename, size_bytes, utc_timestamp()};
    } catch (const std::exception&) {
        return make_error_code(DownloadErrc::ledger_io);
    }

    if (!persistent_) {
        return {};
    }

    if (auto ec = persist()) {
        persistent_ = false;
        spdlog::warn("Cannot write resume ledger {}: {}; tracking in memory only",
                     ledger_path_.string(), ec.message());
        return make_error_code(DownloadErrc::ledger_io);
    }
    return {};
}

std::error_code FileTracker::reset() noexcept {
    entries_.clear();
    persistent_ = true;

    std::error_code ec;
    fs::remove(ledger_path_, ec);
    return ec;
}

const LedgerEntry* FileTracker::entry(std::uint32_t index) const noexcept {
    auto it = entries_.find(index);
    return it == entries_.end() ? nullptr : &it->second;
}

std::error_code FileTracker::persist() noexcept {
    try {
        nlohmann::json doc = nlohmann::json::object();
        for (const auto& [index, e] : entries_) {
            doc[std::to_string(index)] = {
                {"filename", e.filename},
                {"sizeBytes", e.size_bytes},
                {"completedAt", e.completed_at},
            };
        }
        return disk::write_file_atomic(ledger_path_, doc.dump(2));
    } catch (const std::exception&) {
        return make_error_code(DownloadErrc::ledger_io);
    }
}

} // namespace folio::core
