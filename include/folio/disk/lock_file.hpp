// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/disk/error.hpp>
#include <expected>
#include <filesystem>

namespace folio::disk {

// Exclusive run lock for an output directory. The lock file holds the PID
// of its owner; a lock left behind by a dead process is taken over.
class LockFile {
public:
    // Fails with DiskErrc::lock_error when another live process holds it
    [[nodiscard]] static std::expected<LockFile, std::error_code>
    acquire(const std::filesystem::path& path) noexcept;

    ~LockFile();

    LockFile(const LockFile&) = delete;
    LockFile& operator=(const LockFile&) = delete;
    LockFile(LockFile&& other) noexcept;
    LockFile& operator=(LockFile&& other) noexcept;

    // Remove the lock file early
    void release() noexcept;

    [[nodiscard]] bool held() const noexcept { return held_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    LockFile() = default;

    std::filesystem::path path_;
    bool held_{false};
};

} // namespace folio::disk
