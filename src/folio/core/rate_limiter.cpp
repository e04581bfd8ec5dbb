// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/rate_limiter.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>
#include <utility>

namespace folio::core {

RateLimitConfig RateLimitConfig::fixed_rpm(double rpm) noexcept {
    RateLimitConfig cfg;
    cfg.mode = RateMode::fixed_rpm;
    cfg.requests_per_minute = rpm;
    return cfg;
}

RateLimitConfig RateLimitConfig::fixed_delay_of(double seconds) noexcept {
    RateLimitConfig cfg;
    cfg.mode = RateMode::fixed_delay;
    cfg.fixed_delay = seconds;
    return cfg;
}

RateLimiter::RateLimiter(RateLimitConfig config, ClockFn clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : ClockFn{[] { return Clock::now(); }}) {
    // Keep the adaptive bounds sane
    config_.base_delay = std::max(0.0, config_.base_delay);
    config_.max_delay = std::max(config_.base_delay, config_.max_delay);
    config_.backoff_factor = std::max(1.0, config_.backoff_factor);
    config_.decay_factor = std::clamp(config_.decay_factor, 0.0, 1.0);

    switch (config_.mode) {
        case RateMode::adaptive:
            delay_ = config_.base_delay;
            break;
        case RateMode::fixed_rpm:
            delay_ = config_.requests_per_minute > 0.0 ? 60.0 / config_.requests_per_minute : 0.0;
            break;
        case RateMode::fixed_delay:
            delay_ = std::max(0.0, config_.fixed_delay);
            break;
    }
}

RateLimiter::Duration RateLimiter::next_delay() const {
    if (!last_request_) {
        return Duration{0.0};
    }
    Duration elapsed = clock_() - *last_request_;
    Duration remaining = Duration{delay_} - elapsed;
    return remaining.count() > 0.0 ? remaining : Duration{0.0};
}

void RateLimiter::on_request() {
    last_request_ = clock_();
}

void RateLimiter::on_response(ResponseOutcome outcome) noexcept {
    if (outcome == ResponseOutcome::success) {
        consecutive_failures_ = 0;
    } else {
        ++consecutive_failures_;
    }

    if (config_.mode != RateMode::adaptive) {
        return;
    }

    switch (outcome) {
        case ResponseOutcome::throttled: {
            double previous = delay_;
            delay_ = std::min(delay_ * config_.backoff_factor, config_.max_delay);
            if (delay_ != previous) {
                spdlog::warn("Rate limiting: backing off to {:.1f}s delay", delay_);
            }
            break;
        }
        case ResponseOutcome::success:
            delay_ = std::max(config_.base_delay, delay_ * config_.decay_factor);
            break;
        case ResponseOutcome::other_error_code:
        case ResponseOutcome::transport_failure:
            // Not a server-load signal
            break;
    }
}

double RateLimiter::current_rate() const noexcept {
    if (delay_ <= 0.0) {
        return std::numeric_limits<double>::infinity();
    }
    return 60.0 / delay_;
}

} // namespace folio::core
