// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/disk/lock_file.hpp>
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <string>
#include <utility>
#include <fcntl.h>
#include <sys/types.h>
#include <unistd.h>

namespace folio::disk {

namespace {

// PID stored in an existing lock file, 0 when unreadable
pid_t read_owner(const std::filesystem::path& path) noexcept {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) return 0;

    char buf[32] = {};
    ssize_t n = ::read(fd, buf, sizeof(buf) - 1);
    ::close(fd);
    if (n <= 0) return 0;

    char* end = nullptr;
    long pid = std::strtol(buf, &end, 10);
    if (end == buf || pid <= 0) return 0;
    return static_cast<pid_t>(pid);
}

bool process_alive(pid_t pid) noexcept {
    if (pid <= 0) return false;
    if (::kill(pid, 0) == 0) return true;
    return errno == EPERM;  // Exists, owned by someone else
}

std::error_code create_exclusive(const std::filesystem::path& path) noexcept {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        return from_errno(errno);
    }

    char buf[32];
    int len = std::snprintf(buf, sizeof(buf), "%ld\n", static_cast<long>(::getpid()));
    ssize_t n = ::write(fd, buf, static_cast<std::size_t>(len));
    int write_errno = errno;
    ::close(fd);
    if (n != len) {
        ::unlink(path.c_str());
        return from_errno(write_errno);
    }
    return {};
}

} // namespace

std::expected<LockFile, std::error_code>
LockFile::acquire(const std::filesystem::path& path) noexcept {
    auto ec = create_exclusive(path);

    if (ec == make_error_code(DiskErrc::file_exists)) {
        pid_t owner = read_owner(path);
        if (owner == ::getpid() || process_alive(owner)) {
            return std::unexpected(make_error_code(DiskErrc::lock_error));
        }
        spdlog::warn("Removing stale lock {} (pid {} is gone)", path.c_str(), static_cast<long>(owner));
        ::unlink(path.c_str());
        ec = create_exclusive(path);
        if (ec == make_error_code(DiskErrc::file_exists)) {
            // Lost the race to another run
            return std::unexpected(make_error_code(DiskErrc::lock_error));
        }
    }

    if (ec) {
        return std::unexpected(ec);
    }

    LockFile lock;
    try {
        lock.path_ = path;
    } catch (const std::exception&) {
        ::unlink(path.c_str());
        return std::unexpected(make_error_code(DiskErrc::invalid_path));
    }
    lock.held_ = true;
    return lock;
}

LockFile::~LockFile() {
    release();
}

LockFile::LockFile(LockFile&& other) noexcept
    : path_(std::move(other.path_))
    , held_(std::exchange(other.held_, false)) {}

LockFile& LockFile::operator=(LockFile&& other) noexcept {
    if (this != &other) {
        release();
        path_ = std::move(other.path_);
        held_ = std::exchange(other.held_, false);
    }
    return *this;
}

void LockFile::release() noexcept {
    if (held_) {
        ::unlink(path_.c_str());
        held_ = false;
    }
}

} // namespace folio::disk
