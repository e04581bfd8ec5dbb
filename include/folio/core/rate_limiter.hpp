// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/config.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace folio::core {

enum class RateMode : std::uint8_t {
    adaptive,     // Back off on throttling, decay on success
    fixed_rpm,    // Constant spacing of 60/rpm seconds
    fixed_delay   // Constant spacing supplied by the caller
};

// What the server told us about the last request
enum class ResponseOutcome : std::uint8_t {
    success,
    throttled,          // 429 / 503
    other_error_code,   // Any other non-2xx
    transport_failure   // Reset, timeout, DNS...
};

struct RateLimitConfig {
    RateMode mode{RateMode::adaptive};
    double base_delay{BASE_DELAY_SEC};       // Seconds, adaptive floor
    double max_delay{MAX_BACKOFF_SEC};       // Seconds, adaptive ceiling
    double backoff_factor{BACKOFF_FACTOR};   // Applied on throttling
    double decay_factor{DECAY_FACTOR};       // Applied on success
    double requests_per_minute{0.0};         // fixed_rpm only
    double fixed_delay{BASE_DELAY_SEC};      // fixed_delay only

    [[nodiscard]] static RateLimitConfig adaptive() noexcept { return {}; }
    [[nodiscard]] static RateLimitConfig fixed_rpm(double rpm) noexcept;
    [[nodiscard]] static RateLimitConfig fixed_delay_of(double seconds) noexcept;
};

// Computes request spacing. Performs no I/O and never sleeps; the caller
// waits next_delay() before issuing the request and reports it with
// on_request(), then feeds the result back with on_response().
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using Duration = std::chrono::duration<double>;

    explicit RateLimiter(RateLimitConfig config = {}, ClockFn clock = {});

    // Time still to wait before the next request may be issued
    [[nodiscard]] Duration next_delay() const;

    // Record that a request was just issued
    void on_request();

    // Feed back the outcome of the last request
    void on_response(ResponseOutcome outcome) noexcept;

    // Current spacing between requests, independent of elapsed time
    [[nodiscard]] Duration current_delay() const noexcept { return Duration{delay_}; }

    // Effective rate in requests per minute
    [[nodiscard]] double current_rate() const noexcept;

    [[nodiscard]] std::uint32_t consecutive_failures() const noexcept { return consecutive_failures_; }
    [[nodiscard]] RateMode mode() const noexcept { return config_.mode; }
    [[nodiscard]] const RateLimitConfig& config() const noexcept { return config_; }

private:
    RateLimitConfig config_;
    ClockFn clock_;
    double delay_{BASE_DELAY_SEC};
    std::uint32_t consecutive_failures_{0};
    std::optional<Clock::time_point> last_request_;
};

} // namespace folio::core
