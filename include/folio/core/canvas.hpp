// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace folio::core {

// One page/image unit of a manifest, already normalized
struct Canvas {
    std::uint32_t index{0};               // 1-based, stable across runs
    std::string url;                      // Resolved image request URL
    std::optional<std::string> label;     // Human-readable, not filesystem-safe
    std::optional<std::uint32_t> width;   // Pixel dimensions of the requested image
    std::optional<std::uint32_t> height;

    [[nodiscard]] bool has_label() const noexcept { return label && !label->empty(); }
    [[nodiscard]] bool has_dimensions() const noexcept {
        return width && height && *width > 0 && *height > 0;
    }
};

} // namespace folio::core
