// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/disk/error.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace folio::disk {

// Sequential writer for a partial download. The file lives under a
// temporary name until commit() renames it into place; a writer that is
// destroyed without committing removes its temporary file.
class FileWriter {
public:
    FileWriter() = default;
    ~FileWriter();

    FileWriter(const FileWriter&) = delete;
    FileWriter& operator=(const FileWriter&) = delete;
    FileWriter(FileWriter&& other) noexcept;
    FileWriter& operator=(FileWriter&& other) noexcept;

    // Create (truncate) the temporary file
    [[nodiscard]] std::error_code open(const std::filesystem::path& temp_path) noexcept;

    // Append data
    [[nodiscard]] std::error_code write(const void* data, std::size_t size) noexcept;

    // Flush to stable storage
    [[nodiscard]] std::error_code flush() noexcept;

    // fsync, close and atomically rename over final_path
    [[nodiscard]] std::error_code commit(const std::filesystem::path& final_path) noexcept;

    // Close and delete the temporary file
    void discard() noexcept;

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }
    [[nodiscard]] std::uint64_t bytes_written() const noexcept { return written_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    void close() noexcept;

    int fd_{-1};
    std::uint64_t written_{0};
    std::filesystem::path path_;
};

// Write a whole file through a sibling temporary and rename it into place
[[nodiscard]] std::error_code write_file_atomic(const std::filesystem::path& path,
                                                std::string_view contents) noexcept;

} // namespace folio::disk
