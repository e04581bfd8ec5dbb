// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/canvas.hpp>
#include <folio/core/config.hpp>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace folio::core {

// Extensions recognized when looking for existing files on disk
// Must cover every extension extension_for_content_type() can return
inline constexpr std::array<std::string_view, 8> KNOWN_EXTENSIONS{
    "jpeg", "jpg", "png", "tif", "tiff", "webp", "jp2", "gif"
};

// Replace everything outside [A-Za-z0-9_.-] with '_', collapse runs of '_',
// trim leading/trailing '_' and '.', cap the length. Never returns empty.
[[nodiscard]] std::string sanitize_label(std::string_view label,
                                         std::size_t max_length = MAX_LABEL_LENGTH);

// canvas-{index:03d}_{label}.{ext} when labelled, image_{index:03d}.{ext} otherwise
[[nodiscard]] std::string canvas_filename(const Canvas& canvas, std::string_view ext);

// image_{index:03d}.{ext}
[[nodiscard]] std::string legacy_filename(std::uint32_t index, std::string_view ext);

// Map a served Content-Type onto a file extension, empty when unknown
[[nodiscard]] std::string extension_for_content_type(std::string_view content_type);

// Extension of the last path segment of a URL ("default.jpg" -> "jpg"), empty when none
[[nodiscard]] std::string extension_from_url(std::string_view url);

} // namespace folio::core
