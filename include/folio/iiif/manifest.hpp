// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <folio/core/canvas.hpp>
#include <folio/core/config.hpp>
#include <folio/core/error.hpp>
#include <folio/core/http_client.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio::iiif {

// Presentation API generations we understand
enum class ManifestVersion : std::uint8_t {
    v2,        // sequences[0].canvases
    v3,        // items
    unknown
};

[[nodiscard]] std::string_view to_string(ManifestVersion version) noexcept;

struct ManifestOptions {
    std::optional<std::uint32_t> width;             // Requested pixel width
    std::string format{core::DEFAULT_EXTENSION};    // Image API format segment
};

// Normalized manifest: the only thing the engine ever sees is `canvases`
struct Manifest {
    ManifestVersion version{ManifestVersion::unknown};
    std::string id;
    std::string label;
    std::vector<core::Canvas> canvases;
};

// @context first, structure second
[[nodiscard]] ManifestVersion detect_version(const nlohmann::json& doc) noexcept;

// Plain string, language map or array of either; nullopt when absent/empty
[[nodiscard]] std::optional<std::string> extract_label(const nlohmann::json& value);

[[nodiscard]] std::expected<Manifest, std::error_code>
parse_manifest(std::string_view text, const ManifestOptions& options = {}) noexcept;

// Load from a local path or an http(s) URL
[[nodiscard]] std::expected<Manifest, std::error_code>
load_manifest(const std::string& source, core::HttpClient& client,
              const ManifestOptions& options = {}) noexcept;

// Manifest file stem (path or last URL segment), or the fallback directory
[[nodiscard]] std::string default_output_dir(std::string_view source);

} // namespace folio::iiif
