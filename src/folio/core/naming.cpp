// Copyright (c) 2026 changcheng967. All rights reserved.

#include <folio/core/naming.hpp>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace folio::core {

namespace {

bool is_safe_char(char c) noexcept {
    auto uc = static_cast<unsigned char>(c);
    return (uc < 0x80 && std::isalnum(uc)) || c == '_' || c == '.' || c == '-';
}

std::string index_tag(std::uint32_t index) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03u", index);
    return buf;
}

std::string to_lower(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

} // namespace

std::string sanitize_label(std::string_view label, std::size_t max_length) {
    std::string out;
    out.reserve(label.size());

    for (char c : label) {
        char mapped = is_safe_char(c) ? c : '_';
        // Collapse runs of underscores
        if (mapped == '_' && !out.empty() && out.back() == '_') {
            continue;
        }
        out += mapped;
    }

    auto trim = [](std::string& s) {
        auto first = s.find_first_not_of("_.");
        if (first == std::string::npos) {
            s.clear();
            return;
        }
        auto last = s.find_last_not_of("_.");
        s = s.substr(first, last - first + 1);
    };

    trim(out);
    if (out.size() > max_length) {
        out.resize(max_length);
        trim(out);
    }

    if (out.empty()) {
        return "unnamed";
    }
    return out;
}

std::string canvas_filename(const Canvas& canvas, std::string_view ext) {
    if (canvas.has_label()) {
        return "canvas-" + index_tag(canvas.index) + "_" + sanitize_label(*canvas.label)
             + "." + std::string(ext);
    }
    return legacy_filename(canvas.index, ext);
}

std::string legacy_filename(std::uint32_t index, std::string_view ext) {
    return "image_" + index_tag(index) + "." + std::string(ext);
}

std::string extension_for_content_type(std::string_view content_type) {
    // Drop parameters: "image/jpeg; charset=..." -> "image/jpeg"
    auto semi = content_type.find(';');
    if (semi != std::string_view::npos) {
        content_type = content_type.substr(0, semi);
    }
    while (!content_type.empty() && content_type.back() == ' ') {
        content_type.remove_suffix(1);
    }

    auto type = to_lower(content_type);
    if (type == "image/jpeg" || type == "image/jpg" || type == "image/pjpeg") return "jpeg";
    if (type == "image/png") return "png";
    if (type == "image/tiff") return "tiff";
    if (type == "image/webp") return "webp";
    if (type == "image/jp2") return "jp2";
    if (type == "image/gif") return "gif";
    return {};
}

std::string extension_from_url(std::string_view url) {
    auto end = std::min(url.find('?'), url.find('#'));
    if (end != std::string_view::npos) {
        url = url.substr(0, end);
    }
    auto slash = url.rfind('/');
    auto segment = slash == std::string_view::npos ? url : url.substr(slash + 1);
    auto dot = segment.rfind('.');
    if (dot == std::string_view::npos || dot + 1 >= segment.size()) {
        return {};
    }
    return to_lower(segment.substr(dot + 1));
}

} // namespace folio::core
