// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/canvas.hpp>
#include <folio/core/config.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace folio::core {

// Where the expected size of a transfer came from, best first
enum class SizeSource : std::uint8_t {
    content_length,       // GET response header
    head_request,         // Pre-flight HEAD
    dimension_estimate,   // Pixel dimensions * bytes-per-pixel
    unknown               // Raw byte counter only
};

[[nodiscard]] std::string_view to_string(SizeSource source) noexcept;

// Per-format multipliers, overridable at runtime
struct SizeMultipliers {
    double jpeg{JPEG_BYTES_PER_PIXEL};
    double png{PNG_BYTES_PER_PIXEL};
    double tiff{TIFF_BYTES_PER_PIXEL};

    [[nodiscard]] double for_extension(std::string_view ext) const noexcept;
};

// Estimate file size from pixel dimensions, nullopt when the canvas has none
[[nodiscard]] std::optional<std::uint64_t>
estimate_from_dimensions(const Canvas& canvas,
                         std::string_view ext,
                         const SizeMultipliers& multipliers = {}) noexcept;

// Running total for progress reporting. An estimate is raised as soon as
// the received byte count passes it, so progress never exceeds 100%.
class AdaptiveTotal {
public:
    AdaptiveTotal() = default;
    AdaptiveTotal(std::optional<std::uint64_t> total, SizeSource source,
                  double growth_factor = ESTIMATE_GROWTH_FACTOR) noexcept
        : total_(total), source_(total ? source : SizeSource::unknown), growth_(growth_factor) {}

    // Account for newly received bytes
    void advance(std::uint64_t bytes) noexcept;

    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }
    [[nodiscard]] std::optional<std::uint64_t> total() const noexcept { return total_; }
    [[nodiscard]] SizeSource source() const noexcept { return source_; }
    [[nodiscard]] bool known() const noexcept { return total_.has_value(); }

    // 0..100, nullopt when the total is unknown
    [[nodiscard]] std::optional<double> percent() const noexcept;

private:
    std::optional<std::uint64_t> total_;
    SizeSource source_{SizeSource::unknown};
    double growth_{ESTIMATE_GROWTH_FACTOR};
    std::uint64_t received_{0};
};

} // namespace folio::core
