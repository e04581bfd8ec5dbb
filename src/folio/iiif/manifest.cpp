// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/iiif/manifest.hpp>
#include <folio/core/url.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace folio::iiif {

using nlohmann::json;

namespace {

bool context_mentions(const json& ctx, std::string_view needle) {
    if (ctx.is_string()) {
        return ctx.get<std::string>().find(needle) != std::string::npos;
    }
    if (ctx.is_array()) {
        for (const auto& c : ctx) {
            if (c.is_string() && c.get<std::string>().find(needle) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

std::optional<std::uint32_t> positive_int(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return std::nullopt;
    const auto& v = obj[key];
    if (v.is_number_integer()) {
        auto n = v.get<std::int64_t>();
        if (n > 0 && n <= static_cast<std::int64_t>(UINT32_MAX)) {
            return static_cast<std::uint32_t>(n);
        }
    } else if (v.is_number_float()) {
        auto d = v.get<double>();
        if (d >= 1.0 && d <= static_cast<double>(UINT32_MAX)) {
            return static_cast<std::uint32_t>(d);
        }
    }
    return std::nullopt;
}

std::string string_field(const json& obj, const char* key) {
    if (obj.is_object() && obj.contains(key) && obj[key].is_string()) {
        return obj[key].get<std::string>();
    }
    return {};
}

// v3 prefers "id" (ImageService3), v2 uses "@id"
std::string id_of(const json& obj, ManifestVersion version) {
    auto primary = string_field(obj, version == ManifestVersion::v3 ? "id" : "@id");
    return primary.empty() ? string_field(obj, version == ManifestVersion::v3 ? "@id" : "id") : primary;
}

std::string service_id(const json& service, ManifestVersion version) {
    if (service.is_string()) {
        return service.get<std::string>();
    }
    if (service.is_object()) {
        return id_of(service, version);
    }
    if (service.is_array()) {
        // ImageService3 entries first when both flavours are listed
        for (const auto& svc : service) {
            if (auto id = string_field(svc, "id"); !id.empty()) return id;
        }
        for (const auto& svc : service) {
            if (auto id = string_field(svc, "@id"); !id.empty()) return id;
        }
    }
    return {};
}

const json* first_of(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return nullptr;
    const auto& v = obj[key];
    if (v.is_array()) {
        return v.empty() ? nullptr : &v[0];
    }
    return v.is_object() ? &v : nullptr;
}

// The image resource of a canvas: v2 images[0].resource, v3 items[0].items[0].body
const json* image_resource(const json& canvas, ManifestVersion version) {
    if (version == ManifestVersion::v2) {
        const auto* image = first_of(canvas, "images");
        return image ? first_of(*image, "resource") : nullptr;
    }
    const auto* page = first_of(canvas, "items");
    const auto* annotation = page ? first_of(*page, "items") : nullptr;
    return annotation ? first_of(*annotation, "body") : nullptr;
}

const json* canvas_list(const json& doc, ManifestVersion version) {
    if (version == ManifestVersion::v3) {
        return doc.contains("items") && doc["items"].is_array() ? &doc["items"] : nullptr;
    }
    const auto* sequence = first_of(doc, "sequences");
    if (sequence && sequence->contains("canvases") && (*sequence)["canvases"].is_array()) {
        return &(*sequence)["canvases"];
    }
    return nullptr;
}

std::optional<core::Canvas> normalize_canvas(const json& node, std::uint32_t index,
                                             ManifestVersion version,
                                             const ManifestOptions& options) {
    core::Canvas canvas;
    canvas.index = index;
    if (node.contains("label")) {
        canvas.label = extract_label(node["label"]);
    }

    const auto* resource = image_resource(node, version);

    auto width = resource ? positive_int(*resource, "width") : std::nullopt;
    auto height = resource ? positive_int(*resource, "height") : std::nullopt;
    if (!width || !height) {
        width = positive_int(node, "width");
        height = positive_int(node, "height");
    }

    std::string service;
    if (resource && resource->contains("service")) {
        service = service_id((*resource)["service"], version);
    }

    if (service.empty()) {
        // No image service: take the static resource as-is
        auto direct = resource ? id_of(*resource, version) : std::string{};
        if (direct.empty()) {
            return std::nullopt;
        }
        canvas.url = std::move(direct);
        canvas.width = width;
        canvas.height = height;
        return canvas;
    }

    while (!service.empty() && service.back() == '/') {
        service.pop_back();
    }

    std::optional<std::uint32_t> target;
    if (options.width) {
        target = width ? std::min(*width, *options.width) : *options.width;
    } else {
        target = width;
    }

    std::string size;
    if (target) {
        size = std::to_string(*target) + ",";
    } else {
        size = version == ManifestVersion::v3 ? "max" : "full";
    }
    canvas.url = service + "/full/" + size + "/0/default." + options.format;

    if (width && height) {
        std::uint32_t w = target.value_or(*width);
        double scale = static_cast<double>(w) / static_cast<double>(*width);
        canvas.width = w;
        canvas.height = std::max<std::uint32_t>(
            1, static_cast<std::uint32_t>(std::lround(static_cast<double>(*height) * scale)));
    }
    return canvas;
}

} // namespace

std::string_view to_string(ManifestVersion version) noexcept {
    switch (version) {
        case ManifestVersion::v2:      return "2.x";
        case ManifestVersion::v3:      return "3.x";
        case ManifestVersion::unknown: return "unknown";
    }
    return "unknown";
}

ManifestVersion detect_version(const json& doc) noexcept {
    try {
        if (!doc.is_object()) {
            return ManifestVersion::unknown;
        }
        if (doc.contains("@context")) {
            const auto& ctx = doc["@context"];
            if (context_mentions(ctx, "presentation/3")) return ManifestVersion::v3;
            if (context_mentions(ctx, "presentation/2")) return ManifestVersion::v2;
        }
        if (doc.contains("items")) return ManifestVersion::v3;
        if (doc.contains("sequences")) return ManifestVersion::v2;
    } catch (const std::exception& e) {
        spdlog::debug("Version detection failed: {}", e.what());
    }
    return ManifestVersion::unknown;
}

std::optional<std::string> extract_label(const json& value) {
    if (value.is_string()) {
        auto s = value.get<std::string>();
        if (s.empty()) return std::nullopt;
        return s;
    }

    if (value.is_array()) {
        for (const auto& item : value) {
            if (auto label = extract_label(item)) {
                return label;
            }
        }
        return std::nullopt;
    }

    if (value.is_object()) {
        // JSON-LD value object (2.x)
        if (value.contains("@value")) {
            return extract_label(value["@value"]);
        }
        // Language map (3.x)
        for (const char* lang : {"en", "none", "default"}) {
            if (value.contains(lang)) {
                if (auto label = extract_label(value[lang])) {
                    return label;
                }
            }
        }
        for (const auto& [lang, entry] : value.items()) {
            if (auto label = extract_label(entry)) {
                return label;
            }
        }
    }
    return std::nullopt;
}

std::expected<Manifest, std::error_code>
parse_manifest(std::string_view text, const ManifestOptions& options) noexcept {
    try {
        auto doc = json::parse(text, nullptr, false);
        if (doc.is_discarded() || !doc.is_object()) {
            spdlog::error("Manifest is not a JSON object");
            return std::unexpected(make_error_code(core::DownloadErrc::manifest_error));
        }

        Manifest manifest;
        manifest.version = detect_version(doc);
        if (manifest.version == ManifestVersion::unknown) {
            spdlog::error("Unrecognized IIIF manifest layout");
            return std::unexpected(make_error_code(core::DownloadErrc::manifest_error));
        }

        manifest.id = id_of(doc, manifest.version);
        if (doc.contains("label")) {
            manifest.label = extract_label(doc["label"]).value_or("");
        }

        const auto* nodes = canvas_list(doc, manifest.version);
        if (!nodes) {
            return manifest;
        }

        std::uint32_t position = 0;
        for (const auto& node : *nodes) {
            ++position;
            // Indices count kept canvases only, so index N is always the Nth entry
            auto next_index = static_cast<std::uint32_t>(manifest.canvases.size() + 1);
            if (auto canvas = normalize_canvas(node, next_index, manifest.version, options)) {
                manifest.canvases.push_back(std::move(*canvas));
            } else {
                spdlog::warn("Manifest entry {} has no image resource, skipping", position);
            }
        }

        spdlog::debug("Parsed IIIF {} manifest with {} canvases",
                      to_string(manifest.version), manifest.canvases.size());
        return manifest;
    } catch (const std::exception& e) {
        spdlog::error("Manifest parse failed: {}", e.what());
        return std::unexpected(make_error_code(core::DownloadErrc::manifest_error));
    }
}

std::expected<Manifest, std::error_code>
load_manifest(const std::string& source, core::HttpClient& client,
              const ManifestOptions& options) noexcept {
    std::string text;

    if (core::looks_like_http_url(source)) {
        auto body = client.get_text(source);
        if (!body) {
            spdlog::error("Cannot fetch manifest {}: {}", source, body.error().message());
            return std::unexpected(make_error_code(core::DownloadErrc::manifest_error));
        }
        text = std::move(*body);
    } else {
        try {
            std::ifstream in(source, std::ios::binary);
            if (!in) {
                spdlog::error("Cannot open manifest {}", source);
                return std::unexpected(make_error_code(core::DownloadErrc::manifest_error));
            }
            std::stringstream buffer;
            buffer << in.rdbuf();
            text = buffer.str();
        } catch (const std::exception& e) {
            spdlog::error("Cannot read manifest {}: {}", source, e.what());
            return std::unexpected(make_error_code(core::DownloadErrc::manifest_error));
        }
    }

    return parse_manifest(text, options);
}

std::string default_output_dir(std::string_view source) {
    std::string stem;
    if (core::looks_like_http_url(source)) {
        if (auto url = core::Url::parse(source)) {
            stem = url->stem();
        }
    } else {
        stem = std::filesystem::path(source).stem().string();
    }
    return stem.empty() ? std::string(core::DEFAULT_OUTPUT_DIR) : stem;
}

} // namespace folio::iiif
