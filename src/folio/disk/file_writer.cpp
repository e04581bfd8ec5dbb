// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/disk/file_writer.hpp>
#include <cerrno>
#include <exception>
#include <utility>
#include <fcntl.h>
#include <unistd.h>

namespace folio::disk {

//=============================================================================
// FileWriter
//=============================================================================

FileWriter::~FileWriter() {
    discard();
}

FileWriter::FileWriter(FileWriter&& other) noexcept
    : fd_(std::exchange(other.fd_, -1))
    , written_(std::exchange(other.written_, 0))
    , path_(std::move(other.path_)) {}

FileWriter& FileWriter::operator=(FileWriter&& other) noexcept {
    if (this != &other) {
        discard();
        fd_ = std::exchange(other.fd_, -1);
        written_ = std::exchange(other.written_, 0);
        path_ = std::move(other.path_);
    }
    return *this;
}

std::error_code FileWriter::open(const std::filesystem::path& temp_path) noexcept {
    if (is_open()) {
        return make_error_code(DiskErrc::file_exists);
    }

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno);
    }

    try {
        path_ = temp_path;
    } catch (const std::exception&) {
        ::close(fd);
        ::unlink(temp_path.c_str());
        return make_error_code(DiskErrc::invalid_path);
    }
    fd_ = fd;
    written_ = 0;
    return {};
}

std::error_code FileWriter::write(const void* data, std::size_t size) noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }

    const auto* bytes = static_cast<const char*>(data);
    std::size_t remaining = size;
    while (remaining > 0) {
        ssize_t n = ::write(fd_, bytes, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            return from_errno(errno);
        }
        bytes += n;
        remaining -= static_cast<std::size_t>(n);
    }

    written_ += size;
    return {};
}

std::error_code FileWriter::flush() noexcept {
    if (!is_open()) {
        return make_error_code(DiskErrc::handle_invalid);
    }
    if (::fsync(fd_) != 0) {
        return from_errno(errno);
    }
    return {};
}

std::error_code FileWriter::commit(const std::filesystem::path& final_path) noexcept {
    if (auto ec = flush()) {
        return ec;
    }
    close();

    if (::rename(path_.c_str(), final_path.c_str()) != 0) {
        auto ec = from_errno(errno);
        ::unlink(path_.c_str());
        path_.clear();
        return ec ? ec : make_error_code(DiskErrc::rename_error);
    }

    path_.clear();
    return {};
}

void FileWriter::discard() noexcept {
    close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
        path_.clear();
    }
}

void FileWriter::close() noexcept {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

//=============================================================================
// Atomic whole-file replace
//=============================================================================

std::error_code write_file_atomic(const std::filesystem::path& path,
                                  std::string_view contents) noexcept {
    std::filesystem::path tmp;
    try {
        tmp = path;
        tmp += ".tmp";
    } catch (const std::exception&) {
        return make_error_code(DiskErrc::invalid_path);
    }

    FileWriter writer;
    if (auto ec = writer.open(tmp)) {
        return ec;
    }
    if (auto ec = writer.write(contents.data(), contents.size())) {
        return ec;
    }
    return writer.commit(path);
}

} // namespace folio::disk
