// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/http_client.hpp>
#include <folio/core/rate_limiter.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace folio::test {

// Scratch directory removed on destruction
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        auto base = std::filesystem::temp_directory_path();
        for (;;) {
            path_ = base / ("folio-test-" + std::to_string(rd()));
            if (std::filesystem::create_directory(path_)) break;
        }
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

inline void write_file(const std::filesystem::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
}

// Names of the regular files in a directory, hidden ones included
inline std::vector<std::string> list_files(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            names.push_back(entry.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

// One scripted answer
struct FakeResponse {
    std::int32_t status{200};
    std::string body;
    std::string content_type{"image/jpeg"};
    bool send_length{true};              // Emit Content-Length
    std::optional<std::error_code> error; // Transport failure instead of a response

    static FakeResponse ok(std::string body, std::string type = "image/jpeg") {
        FakeResponse r;
        r.body = std::move(body);
        r.content_type = std::move(type);
        return r;
    }
    static FakeResponse status_only(std::int32_t code) {
        FakeResponse r;
        r.status = code;
        r.body = "error";
        r.content_type = "text/plain";
        return r;
    }
    static FakeResponse failure(std::error_code ec) {
        FakeResponse r;
        r.error = ec;
        return r;
    }
};

// Scripted HttpClient. Each URL has a queue of answers; the last answer
// repeats once the queue is down to one. Unknown URLs answer 404.
class FakeHttpClient final : public core::HttpClient {
public:
    void on_get(const std::string& url, std::vector<FakeResponse> script) {
        gets_[url] = std::deque<FakeResponse>(script.begin(), script.end());
    }
    void on_head(const std::string& url, FakeResponse response) {
        heads_[url] = std::move(response);
    }

    // Runs after each body chunk is delivered
    std::function<void()> after_chunk;
    std::size_t chunk_size{4};

    [[nodiscard]] std::expected<core::HttpResponse, std::error_code>
    head(const std::string& url) noexcept override {
        head_log.push_back(url);
        auto it = heads_.find(url);
        FakeResponse r = it == heads_.end() ? FakeResponse::status_only(405) : it->second;
        if (r.error) return std::unexpected(*r.error);
        return make_response(r);
    }

    [[nodiscard]] std::expected<core::HttpResponse, std::error_code>
    get(const std::string& url,
        const core::HeadersCallback& on_headers,
        const core::ChunkCallback& on_chunk) noexcept override {
        get_log.push_back(url);

        FakeResponse r = FakeResponse::status_only(404);
        if (auto it = gets_.find(url); it != gets_.end() && !it->second.empty()) {
            r = it->second.front();
            if (it->second.size() > 1) it->second.pop_front();
        }
        if (r.error) return std::unexpected(*r.error);

        auto resp = make_response(r);
        if (on_headers) on_headers(resp);
        if (resp.ok() && on_chunk) {
            for (std::size_t pos = 0; pos < r.body.size(); pos += chunk_size) {
                auto n = std::min(chunk_size, r.body.size() - pos);
                std::span<const std::byte> chunk(reinterpret_cast<const std::byte*>(r.body.data() + pos), n);
                if (!on_chunk(chunk)) {
                    return std::unexpected(make_error_code(core::DownloadErrc::cancelled));
                }
                if (after_chunk) after_chunk();
            }
        }
        return resp;
    }

    [[nodiscard]] std::size_t gets_for(const std::string& url) const {
        return static_cast<std::size_t>(std::count(get_log.begin(), get_log.end(), url));
    }

    std::vector<std::string> get_log;
    std::vector<std::string> head_log;

private:
    static core::HttpResponse make_response(const FakeResponse& r) {
        core::HttpResponse resp;
        resp.status_code = r.status;
        resp.content_type = r.content_type;
        resp.headers["content-type"] = r.content_type;
        if (r.send_length) {
            resp.content_length = r.body.size();
            resp.headers["content-length"] = std::to_string(r.body.size());
        }
        return resp;
    }

    std::map<std::string, std::deque<FakeResponse>> gets_;
    std::map<std::string, FakeResponse> heads_;
};

// Manually advanced steady clock
struct FakeClock {
    core::RateLimiter::Clock::time_point now{};

    void advance(double seconds) {
        now += std::chrono::duration_cast<core::RateLimiter::Clock::duration>(
            std::chrono::duration<double>(seconds));
    }

    [[nodiscard]] core::RateLimiter::ClockFn fn() {
        return [this] { return now; };
    }
};

} // namespace folio::test
