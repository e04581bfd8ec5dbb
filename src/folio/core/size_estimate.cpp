// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/size_estimate.hpp>
#include <algorithm>
#include <cmath>

namespace folio::core {

std::string_view to_string(SizeSource source) noexcept {
    switch (source) {
        case SizeSource::content_length:     return "content-length";
        case SizeSource::head_request:       return "head";
        case SizeSource::dimension_estimate: return "estimate";
        case SizeSource::unknown:            return "unknown";
    }
    return "unknown";
}

double SizeMultipliers::for_extension(std::string_view ext) const noexcept {
    if (ext == "png") return png;
    if (ext == "tif" || ext == "tiff") return tiff;
    // jpeg, jpg and anything else compressed similarly
    return jpeg;
}

std::optional<std::uint64_t>
estimate_from_dimensions(const Canvas& canvas,
                         std::string_view ext,
                         const SizeMultipliers& multipliers) noexcept {
    if (!canvas.has_dimensions()) {
        return std::nullopt;
    }

    double pixels = static_cast<double>(*canvas.width) * static_cast<double>(*canvas.height);
    auto estimate = static_cast<std::uint64_t>(std::llround(pixels * multipliers.for_extension(ext)));
    return std::max(estimate, MIN_SIZE_ESTIMATE);
}

void AdaptiveTotal::advance(std::uint64_t bytes) noexcept {
    received_ += bytes;

    if (total_ && received_ > *total_) {
        if (source_ == SizeSource::dimension_estimate) {
            total_ = static_cast<std::uint64_t>(static_cast<double>(received_) * growth_);
        } else {
            // Server lied about the length; keep the counter honest
            total_ = received_;
        }
    }
}

std::optional<double> AdaptiveTotal::percent() const noexcept {
    if (!total_ || *total_ == 0) {
        return std::nullopt;
    }
    double pct = static_cast<double>(received_) * 100.0 / static_cast<double>(*total_);
    return std::min(pct, 100.0);
}

} // namespace folio::core
